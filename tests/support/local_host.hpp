#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>
#include <ssh/channel_io.hpp>
#include <ssh/remote_host.hpp>
#include <transfer/remote_fs.hpp>

// A /bin/sh child with its three standard streams on pipes. Behaves like
// an exec channel: non-blocking reads, EOF per stream, exit status.
class LocalChannel : public ChannelIO {
public:
    LocalChannel(const std::string& command, const std::filesystem::path& home,
                 const ExecOptions& opts);
    ~LocalChannel() override;

    bool started() const { return pid_ > 0; }

    int read_stdout(char* buf, size_t len) override;
    int read_stderr(char* buf, size_t len) override;
    int write(const char* data, size_t len) override;
    void send_eof() override;
    bool eof() override { return out_eof_ && err_eof_; }
    int exit_status() override;
    void resize(int, int) override {}
    int wait_fd() const override;
    void close() override;

private:
    pid_t pid_ = -1;
    int in_fd_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool out_eof_ = false;
    bool err_eof_ = false;
    bool reaped_ = false;
    int status_ = -1;

    int read_fd(int& fd, bool& eof_flag, char* buf, size_t len);
    void reap(bool block);
};

// RemoteFs straight onto the local file system (the "structured" backend).
class LocalFs : public RemoteFs {
public:
    // torn_uploads: write half of each upload under the target name, then fail
    explicit LocalFs(std::filesystem::path home, bool torn_uploads = false)
        : home_(std::move(home)), torn_uploads_(torn_uploads) {}

    const char* backend() const override { return "local"; }
    Result<std::string> home() override { return Result<std::string>::Ok(home_.string()); }
    Result<RemoteEntry> stat(const std::string& path) override;
    Result<std::vector<RemoteEntry>> list_dir(const std::string& path) override;
    Result<void> mkdir_p(const std::string& path) override;
    Result<void> download(const std::string& remote, const std::filesystem::path& local) override;
    Result<void> upload(const std::filesystem::path& local, const std::string& remote) override;

private:
    std::filesystem::path home_;
    bool torn_uploads_;
};

// RemoteHost whose "remote side" is this machine with HOME pointed at a
// scratch directory. Every command goes through /bin/sh exactly as the SSH
// path would send it.
class LocalHost : public RemoteHost {
public:
    explicit LocalHost(std::filesystem::path home, bool structured_fs = true);

    Result<std::unique_ptr<ChannelIO>> open_exec(const std::string& command,
                                                 const ExecOptions& opts = {}) override;
    Result<std::unique_ptr<ChannelIO>> open_shell(const ExecOptions& opts) override;
    Result<std::unique_ptr<RemoteFs>> open_sftp() override;
    std::string label() const override { return "local:" + home_.string(); }

    // Run `replacement` whenever exactly `command` is requested. The
    // original command is still what commands() records.
    void stub(const std::string& command, const std::string& replacement) {
        stubs_[command] = replacement;
    }

    // Structured uploads break off halfway, leaving the partial file behind.
    void tear_uploads() { torn_uploads_ = true; }

    const std::vector<std::string>& commands() const { return commands_; }
    const std::filesystem::path& home() const { return home_; }

private:
    std::filesystem::path home_;
    bool structured_fs_;
    bool torn_uploads_ = false;
    std::vector<std::string> commands_;
    std::map<std::string, std::string> stubs_;
};

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& tag);
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

void write_text(const std::filesystem::path& path, const std::string& content);
std::string read_text(const std::filesystem::path& path);
