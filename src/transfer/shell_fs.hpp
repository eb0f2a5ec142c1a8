#pragma once

#include "remote_fs.hpp"
#include <ssh/remote_host.hpp>

// RemoteFs built from plain commands on exec channels, for hosts without
// SFTP (restricted shells, minimal images). Needs a POSIX sh, cat, mkdir,
// mv, wc and ls on the remote side.
//
// Uploads stream into "<target>.part" and are renamed into place only
// after the whole file arrived, so a broken transfer never leaves a
// truncated file under the real name.
class ShellFs : public RemoteFs {
public:
    explicit ShellFs(RemoteHost& host);

    const char* backend() const override { return "shell"; }
    Result<std::string> home() override;
    Result<RemoteEntry> stat(const std::string& path) override;
    Result<std::vector<RemoteEntry>> list_dir(const std::string& path) override;
    Result<void> mkdir_p(const std::string& path) override;
    Result<void> download(const std::string& remote, const std::filesystem::path& local) override;
    Result<void> upload(const std::filesystem::path& local, const std::string& remote) override;

    bool structured_listing() const override { return false; }
    Result<std::string> raw_listing(const std::string& path) override;

private:
    RemoteHost& host_;
    std::string home_;
};
