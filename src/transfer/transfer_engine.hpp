#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <core/logger.hpp>
#include <core/types.hpp>
#include <ssh/remote_host.hpp>
#include "remote_fs.hpp"

// SFTP when the host offers it, otherwise the shell fallback. Protocol
// unavailability is logged, not returned.
Result<std::unique_ptr<RemoteFs>> open_remote_fs(RemoteHost& host, Logger& logger);

struct ListResult {
    std::string path;                    // normalized
    std::vector<RemoteEntry> entries;    // sorted case-insensitively
    bool raw = false;                    // fallback: raw_text holds the listing
    std::string raw_text;
};

// Outcome of a batch. One failing path never stops the others.
struct TransferReport {
    std::vector<std::string> transferred;
    std::vector<std::string> skipped;
    std::vector<std::pair<std::string, std::string>> failed;   // path, reason

    bool ok() const { return failed.empty(); }
};

class TransferEngine {
public:
    TransferEngine(RemoteFs& fs, Logger& logger);

    // Absolute remote path ("~" and relative paths against the remote home).
    Result<std::string> normalize(const std::string& path);

    Result<ListResult> list(const std::string& path);

    // Idempotent.
    Result<void> ensure_dir(const std::string& path);

    TransferReport download(const std::vector<std::string>& remote_paths,
                            const std::filesystem::path& local_dir, bool recursive);

    TransferReport upload(const std::vector<std::filesystem::path>& local_paths,
                          const std::string& remote_dest, bool recursive);

    RemoteFs& fs() { return fs_; }

private:
    RemoteFs& fs_;
    Logger& logger_;
    std::string home_;

    void download_dir(const std::string& remote, const std::filesystem::path& local,
                      bool recursive, TransferReport& report);
    void upload_dir(const std::filesystem::path& local, const std::string& remote,
                    bool recursive, TransferReport& report);
};
