#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>

enum class EntryKind { File, Directory };

struct RemoteEntry {
    std::string name;
    EntryKind kind = EntryKind::File;
    uint64_t size = 0;

    bool is_dir() const { return kind == EntryKind::Directory; }
};

// File access on the remote host. Paths passed in are absolute
// (see normalize_remote_path). Missing paths fail with PathNotFound.
class RemoteFs {
public:
    virtual ~RemoteFs() = default;

    // "sftp" or "shell", for messages
    virtual const char* backend() const = 0;

    virtual Result<std::string> home() = 0;
    virtual Result<RemoteEntry> stat(const std::string& path) = 0;

    // Directory entries without "." and "..", in no particular order.
    virtual Result<std::vector<RemoteEntry>> list_dir(const std::string& path) = 0;

    // Create the directory and its parents. Succeeds if it already exists.
    virtual Result<void> mkdir_p(const std::string& path) = 0;

    virtual Result<void> download(const std::string& remote, const std::filesystem::path& local) = 0;
    virtual Result<void> upload(const std::filesystem::path& local, const std::string& remote) = 0;

    // False when listings should be shown as the remote tool prints them.
    virtual bool structured_listing() const { return true; }
    virtual Result<std::string> raw_listing(const std::string& path) {
        return Result<std::string>::Err("No raw listing for " + path, ErrorKind::ProtocolUnavailable);
    }
};
