#include "sftp_fs.hpp"
#include "remote_path.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <chrono>
#include <fstream>

namespace fs = std::filesystem;

static bool timed_out(const std::chrono::steady_clock::time_point& deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

static std::chrono::steady_clock::time_point op_deadline() {
    return std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CMD_TIMEOUT_SECS);
}

SftpFs::SftpFs(LIBSSH2_SFTP* sftp, LIBSSH2_SESSION* session)
    : sftp_(sftp), session_(session) {
}

SftpFs::~SftpFs() {
    if (!sftp_) return;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (libssh2_sftp_shutdown(sftp_) == LIBSSH2_ERROR_EAGAIN && !timed_out(deadline)) {
        platform::sleep_ms(10);
    }
}

ErrorKind SftpFs::classify_error() const {
    if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
            return ErrorKind::PathNotFound;
        }
    }
    return ErrorKind::Io;
}

Result<std::string> SftpFs::home() {
    char buf[1024];
    int rc;
    auto deadline = op_deadline();
    while ((rc = libssh2_sftp_realpath(sftp_, ".", buf, sizeof(buf))) == LIBSSH2_ERROR_EAGAIN &&
           !timed_out(deadline)) {
        platform::sleep_ms(10);
    }
    if (rc <= 0) {
        return Result<std::string>::Err("Cannot resolve remote home directory", ErrorKind::Io);
    }
    return Result<std::string>::Ok(std::string(buf, static_cast<size_t>(rc)));
}

static RemoteEntry entry_from_attrs(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteEntry e;
    e.name = name;
    if ((attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
        (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR) {
        e.kind = EntryKind::Directory;
    }
    if (!e.is_dir() && (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
        e.size = attrs.filesize;
    }
    return e;
}

Result<RemoteEntry> SftpFs::stat(const std::string& path) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int rc;
    auto deadline = op_deadline();
    while ((rc = libssh2_sftp_stat(sftp_, path.c_str(), &attrs)) == LIBSSH2_ERROR_EAGAIN &&
           !timed_out(deadline)) {
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        ErrorKind kind = classify_error();
        return Result<RemoteEntry>::Err(
            kind == ErrorKind::PathNotFound ? "No such file or directory: " + path
                                            : "Cannot stat " + path,
            kind);
    }
    return Result<RemoteEntry>::Ok(entry_from_attrs(remote_basename(path), attrs));
}

Result<std::vector<RemoteEntry>> SftpFs::list_dir(const std::string& path) {
    using R = Result<std::vector<RemoteEntry>>;

    LIBSSH2_SFTP_HANDLE* dir = nullptr;
    auto deadline = op_deadline();
    while ((dir = libssh2_sftp_opendir(sftp_, path.c_str())) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN || timed_out(deadline)) {
            ErrorKind kind = classify_error();
            return R::Err("Cannot open directory " + path, kind);
        }
        platform::sleep_ms(10);
    }

    std::vector<RemoteEntry> entries;
    char name[512];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    for (;;) {
        int n = libssh2_sftp_readdir(dir, name, sizeof(name), &attrs);
        if (n == LIBSSH2_ERROR_EAGAIN) {
            if (timed_out(deadline)) break;
            platform::sleep_ms(10);
            continue;
        }
        if (n <= 0) break;
        std::string entry_name(name, static_cast<size_t>(n));
        if (entry_name == "." || entry_name == "..") continue;
        entries.push_back(entry_from_attrs(entry_name, attrs));
    }

    while (libssh2_sftp_closedir(dir) == LIBSSH2_ERROR_EAGAIN && !timed_out(deadline)) {
        platform::sleep_ms(10);
    }
    return R::Ok(entries);
}

Result<void> SftpFs::mkdir_p(const std::string& path) {
    // Walk from the root, creating what is missing
    std::string current;
    size_t start = 1;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        current = path.substr(0, slash);
        start = slash == std::string::npos ? path.size() + 1 : slash + 1;
        if (current.empty()) continue;

        auto existing = stat(current);
        if (existing.is_ok()) {
            if (!existing.value.is_dir()) {
                return Result<void>::Err(current + " exists and is not a directory", ErrorKind::Io);
            }
            continue;
        }

        int rc;
        auto deadline = op_deadline();
        while ((rc = libssh2_sftp_mkdir(sftp_, current.c_str(), 0755)) == LIBSSH2_ERROR_EAGAIN &&
               !timed_out(deadline)) {
            platform::sleep_ms(10);
        }
        // Lost a race with another creator: fine if it is a directory now
        if (rc != 0) {
            auto again = stat(current);
            if (again.is_ok() && again.value.is_dir()) continue;
            return Result<void>::Err("Cannot create directory " + current, ErrorKind::Io);
        }
    }
    return Result<void>::Ok();
}

Result<void> SftpFs::download(const std::string& remote, const fs::path& local) {
    LIBSSH2_SFTP_HANDLE* fh = nullptr;
    auto deadline = op_deadline();
    while ((fh = libssh2_sftp_open(sftp_, remote.c_str(), LIBSSH2_FXF_READ, 0)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN || timed_out(deadline)) {
            ErrorKind kind = classify_error();
            return Result<void>::Err("Cannot open remote file " + remote, kind);
        }
        platform::sleep_ms(10);
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    Result<void> result = Result<void>::Ok();
    if (!out) {
        result = Result<void>::Err("Cannot write " + local.string(), ErrorKind::Io);
    } else {
        char buf[SFTP_CHUNK_SIZE];
        for (;;) {
            ssize_t n = libssh2_sftp_read(fh, buf, sizeof(buf));
            if (n == LIBSSH2_ERROR_EAGAIN) {
                if (timed_out(deadline)) {
                    result = Result<void>::Err("Timed out reading " + remote, ErrorKind::Timeout);
                    break;
                }
                platform::sleep_ms(1);
                continue;
            }
            if (n < 0) {
                result = Result<void>::Err("Read error on " + remote, ErrorKind::Io);
                break;
            }
            if (n == 0) break;
            out.write(buf, n);
        }
        if (result.is_ok() && !out) {
            result = Result<void>::Err("Write error on " + local.string(), ErrorKind::Io);
        }
    }

    while (libssh2_sftp_close(fh) == LIBSSH2_ERROR_EAGAIN && !timed_out(deadline)) {
        platform::sleep_ms(10);
    }
    return result;
}

Result<void> SftpFs::upload(const fs::path& local, const std::string& remote) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return Result<void>::Err("Cannot read " + local.string(), ErrorKind::PathNotFound);
    }

    // Written under <remote>.part and renamed once complete, so the real
    // name never holds a truncated file
    const std::string part = remote + ".part";
    LIBSSH2_SFTP_HANDLE* fh = nullptr;
    auto deadline = op_deadline();
    while ((fh = libssh2_sftp_open(sftp_, part.c_str(),
                                   LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                   0644)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN || timed_out(deadline)) {
            ErrorKind kind = classify_error();
            return Result<void>::Err("Cannot create remote file " + remote, kind);
        }
        platform::sleep_ms(10);
    }

    Result<void> result = Result<void>::Ok();
    char buf[SFTP_CHUNK_SIZE];
    while (result.is_ok() && in) {
        in.read(buf, sizeof(buf));
        std::streamsize got = in.gcount();
        std::streamsize sent = 0;
        while (sent < got) {
            ssize_t w = libssh2_sftp_write(fh, buf + sent, static_cast<size_t>(got - sent));
            if (w == LIBSSH2_ERROR_EAGAIN) {
                if (timed_out(deadline)) {
                    result = Result<void>::Err("Timed out writing " + remote, ErrorKind::Timeout);
                    break;
                }
                platform::sleep_ms(1);
                continue;
            }
            if (w < 0) {
                result = Result<void>::Err("Write error on " + remote, ErrorKind::Io);
                break;
            }
            sent += w;
        }
    }

    while (libssh2_sftp_close(fh) == LIBSSH2_ERROR_EAGAIN && !timed_out(deadline)) {
        platform::sleep_ms(10);
    }

    if (result.is_ok()) result = finish_part(part, remote);
    if (result.is_err()) unlink(part);
    return result;
}

Result<void> SftpFs::finish_part(const std::string& part, const std::string& remote) {
    auto move_into_place = [&](long flags) {
        int rc;
        auto deadline = op_deadline();
        while ((rc = libssh2_sftp_rename_ex(sftp_, part.c_str(),
                                            static_cast<unsigned int>(part.size()),
                                            remote.c_str(),
                                            static_cast<unsigned int>(remote.size()),
                                            flags)) == LIBSSH2_ERROR_EAGAIN &&
               !timed_out(deadline)) {
            platform::sleep_ms(10);
        }
        return rc;
    };

    if (move_into_place(LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC |
               LIBSSH2_SFTP_RENAME_NATIVE) == 0) {
        return Result<void>::Ok();
    }
    // SFTPv3 servers refuse to rename over an existing file
    unlink(remote);
    if (move_into_place(0) == 0) return Result<void>::Ok();
    return Result<void>::Err("Cannot move " + part + " into place", ErrorKind::Io);
}

void SftpFs::unlink(const std::string& path) {
    auto deadline = op_deadline();
    while (libssh2_sftp_unlink(sftp_, path.c_str()) == LIBSSH2_ERROR_EAGAIN &&
           !timed_out(deadline)) {
        platform::sleep_ms(10);
    }
}
