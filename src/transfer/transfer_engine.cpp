#include "transfer_engine.hpp"
#include "remote_path.hpp"
#include "shell_fs.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace fs = std::filesystem;

// A single path component that stays inside the directory it is joined to.
static bool safe_local_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

Result<std::unique_ptr<RemoteFs>> open_remote_fs(RemoteHost& host, Logger& logger) {
    auto sftp = host.open_sftp();
    if (sftp.is_ok()) {
        return sftp;
    }
    if (sftp.kind != ErrorKind::ProtocolUnavailable) {
        return sftp;
    }
    logger.info(fmt::format("SFTP unavailable on {}; using shell transfer", host.label()));
    logger.debug(sftp.error);
    return Result<std::unique_ptr<RemoteFs>>::Ok(std::make_unique<ShellFs>(host));
}

TransferEngine::TransferEngine(RemoteFs& fs, Logger& logger) : fs_(fs), logger_(logger) {}

Result<std::string> TransferEngine::normalize(const std::string& path) {
    if (home_.empty()) {
        auto home = fs_.home();
        if (home.is_err()) return home;
        home_ = home.value;
    }
    return Result<std::string>::Ok(normalize_remote_path(path, home_));
}

Result<ListResult> TransferEngine::list(const std::string& path) {
    auto target = normalize(path);
    if (target.is_err()) return Result<ListResult>::Err(target.error, target.kind);

    ListResult result;
    result.path = target.value;

    if (!fs_.structured_listing()) {
        auto raw = fs_.raw_listing(result.path);
        if (raw.is_err()) return Result<ListResult>::Err(raw.error, raw.kind);
        result.raw = true;
        result.raw_text = raw.value;
        return Result<ListResult>::Ok(result);
    }

    auto st = fs_.stat(result.path);
    if (st.is_err()) return Result<ListResult>::Err(st.error, st.kind);

    if (!st.value.is_dir()) {
        result.entries.push_back(st.value);
        return Result<ListResult>::Ok(result);
    }

    auto entries = fs_.list_dir(result.path);
    if (entries.is_err()) return Result<ListResult>::Err(entries.error, entries.kind);
    result.entries = std::move(entries.value);
    std::sort(result.entries.begin(), result.entries.end(),
              [](const RemoteEntry& a, const RemoteEntry& b) { return iless(a.name, b.name); });
    return Result<ListResult>::Ok(result);
}

Result<void> TransferEngine::ensure_dir(const std::string& path) {
    auto target = normalize(path);
    if (target.is_err()) return Result<void>::Err(target.error, target.kind);
    return fs_.mkdir_p(target.value);
}

// ── Download ─────────────────────────────────────────────────

TransferReport TransferEngine::download(const std::vector<std::string>& remote_paths,
                                        const fs::path& local_dir, bool recursive) {
    TransferReport report;

    std::error_code ec;
    fs::create_directories(local_dir, ec);
    if (ec) {
        for (const auto& p : remote_paths) {
            report.failed.emplace_back(p, "Cannot create " + local_dir.string() + ": " + ec.message());
        }
        return report;
    }

    for (const auto& path : remote_paths) {
        auto target = normalize(path);
        if (target.is_err()) {
            report.failed.emplace_back(path, target.error);
            continue;
        }

        auto st = fs_.stat(target.value);
        if (st.is_err()) {
            logger_.error(fmt::format("Download failed: {}: {}", path, st.error));
            report.failed.emplace_back(path, st.error);
            continue;
        }

        // The remote root has no name of its own; its contents land in local_dir
        std::string name = remote_basename(target.value);
        fs::path dest = safe_local_name(name) ? local_dir / name : local_dir;
        if (dest == local_dir && !st.value.is_dir()) {
            report.failed.emplace_back(path, "Cannot derive a local name for " + target.value);
            continue;
        }
        if (st.value.is_dir()) {
            download_dir(target.value, dest, recursive, report);
            continue;
        }

        auto r = fs_.download(target.value, dest);
        if (r.is_err()) {
            logger_.error(fmt::format("Download failed: {}: {}", path, r.error));
            report.failed.emplace_back(path, r.error);
        } else {
            logger_.info(fmt::format("Downloaded {} -> {}", target.value, dest.string()));
            report.transferred.push_back(target.value);
        }
    }
    return report;
}

void TransferEngine::download_dir(const std::string& remote, const fs::path& local,
                                  bool recursive, TransferReport& report) {
    auto entries = fs_.list_dir(remote);
    if (entries.is_err()) {
        report.failed.emplace_back(remote, entries.error);
        return;
    }

    std::error_code ec;
    fs::create_directories(local, ec);
    if (ec) {
        report.failed.emplace_back(remote, "Cannot create " + local.string() + ": " + ec.message());
        return;
    }

    for (const auto& e : entries.value) {
        std::string child = remote_join(remote, e.name);
        if (!safe_local_name(e.name)) {
            logger_.warn(fmt::format("Skipping {}: unusable local name", child));
            report.skipped.push_back(child);
            continue;
        }
        if (e.is_dir()) {
            if (recursive) {
                download_dir(child, local / e.name, recursive, report);
            } else {
                logger_.warn(fmt::format("Skipping directory {} (use -r)", child));
                report.skipped.push_back(child);
            }
            continue;
        }
        auto r = fs_.download(child, local / e.name);
        if (r.is_err()) {
            logger_.error(fmt::format("Download failed: {}: {}", child, r.error));
            report.failed.emplace_back(child, r.error);
        } else {
            report.transferred.push_back(child);
        }
    }
}

// ── Upload ───────────────────────────────────────────────────

TransferReport TransferEngine::upload(const std::vector<fs::path>& local_paths,
                                      const std::string& remote_dest, bool recursive) {
    TransferReport report;

    auto dest = normalize(remote_dest);
    Result<void> made = dest.is_ok() ? fs_.mkdir_p(dest.value)
                                     : Result<void>::Err(dest.error, dest.kind);
    if (made.is_err()) {
        for (const auto& p : local_paths) report.failed.emplace_back(p.string(), made.error);
        return report;
    }

    for (const auto& path : local_paths) {
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            logger_.error("Upload failed: no such local path: " + path.string());
            report.failed.emplace_back(path.string(), "No such file or directory");
            continue;
        }

        std::string name = path.filename().empty() ? path.parent_path().filename().string()
                                                   : path.filename().string();
        std::string target = remote_join(dest.value, name);

        if (fs::is_directory(status)) {
            upload_dir(path, target, recursive, report);
            continue;
        }

        auto r = fs_.upload(path, target);
        if (r.is_err()) {
            logger_.error(fmt::format("Upload failed: {}: {}", path.string(), r.error));
            report.failed.emplace_back(path.string(), r.error);
        } else {
            logger_.info(fmt::format("Uploaded {} -> {}", path.string(), target));
            report.transferred.push_back(path.string());
        }
    }
    return report;
}

void TransferEngine::upload_dir(const fs::path& local, const std::string& remote,
                                bool recursive, TransferReport& report) {
    auto made = fs_.mkdir_p(remote);
    if (made.is_err()) {
        report.failed.emplace_back(local.string(), made.error);
        return;
    }

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(local, ec)) {
        std::string child = remote_join(remote, entry.path().filename().string());
        if (entry.is_directory(ec)) {
            if (recursive) {
                upload_dir(entry.path(), child, recursive, report);
            } else {
                logger_.warn(fmt::format("Skipping directory {} (use -r)", entry.path().string()));
                report.skipped.push_back(entry.path().string());
            }
            continue;
        }
        auto r = fs_.upload(entry.path(), child);
        if (r.is_err()) {
            logger_.error(fmt::format("Upload failed: {}: {}", entry.path().string(), r.error));
            report.failed.emplace_back(entry.path().string(), r.error);
        } else {
            report.transferred.push_back(entry.path().string());
        }
    }
    if (ec) {
        report.failed.emplace_back(local.string(), ec.message());
    }
}
