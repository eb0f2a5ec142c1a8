#pragma once

#include "remote_fs.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// RemoteFs over an SFTP subsystem channel. Owns the SFTP handle; the
// session must outlive it.
class SftpFs : public RemoteFs {
public:
    SftpFs(LIBSSH2_SFTP* sftp, LIBSSH2_SESSION* session);
    ~SftpFs() override;

    SftpFs(const SftpFs&) = delete;
    SftpFs& operator=(const SftpFs&) = delete;

    const char* backend() const override { return "sftp"; }
    Result<std::string> home() override;
    Result<RemoteEntry> stat(const std::string& path) override;
    Result<std::vector<RemoteEntry>> list_dir(const std::string& path) override;
    Result<void> mkdir_p(const std::string& path) override;
    Result<void> download(const std::string& remote, const std::filesystem::path& local) override;
    Result<void> upload(const std::filesystem::path& local, const std::string& remote) override;

private:
    LIBSSH2_SFTP* sftp_;
    LIBSSH2_SESSION* session_;

    ErrorKind classify_error() const;
    Result<void> finish_part(const std::string& part, const std::string& remote);
    void unlink(const std::string& path);
};
