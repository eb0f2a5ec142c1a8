#include "shell_fs.hpp"
#include "remote_path.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static std::string command_error(const SSHResult& r, const std::string& what) {
    std::string detail = r.stderr_data;
    trim(detail);
    if (detail.empty()) return what;
    return what + ": " + detail;
}

ShellFs::ShellFs(RemoteHost& host) : host_(host) {}

Result<std::string> ShellFs::home() {
    if (!home_.empty()) return Result<std::string>::Ok(home_);
    auto r = run_command(host_, "cd ~ && pwd");
    std::string out = r.stdout_data;
    trim(out);
    if (r.failed() || out.empty()) {
        return Result<std::string>::Err(command_error(r, "Cannot resolve remote home directory"),
                                        ErrorKind::Io);
    }
    home_ = out;
    return Result<std::string>::Ok(home_);
}

Result<RemoteEntry> ShellFs::stat(const std::string& path) {
    std::string q = shell_quote(path);
    auto r = run_command(host_, fmt::format(
        "if [ -d {0} ]; then echo d 0; elif [ -e {0} ]; then echo f $(wc -c < {0}); "
        "else echo missing; fi", q));
    if (r.failed()) {
        return Result<RemoteEntry>::Err(command_error(r, "Cannot stat " + path), ErrorKind::Io);
    }

    std::istringstream in(r.stdout_data);
    std::string kind;
    uint64_t size = 0;
    in >> kind >> size;
    if (kind == "missing" || kind.empty()) {
        return Result<RemoteEntry>::Err("No such file or directory: " + path, ErrorKind::PathNotFound);
    }

    RemoteEntry e;
    e.name = remote_basename(path);
    e.kind = kind == "d" ? EntryKind::Directory : EntryKind::File;
    e.size = e.is_dir() ? 0 : size;
    return Result<RemoteEntry>::Ok(e);
}

Result<std::vector<RemoteEntry>> ShellFs::list_dir(const std::string& path) {
    using R = Result<std::vector<RemoteEntry>>;

    // One "<d|f> <size> <name>" line per entry, dotfiles included
    std::string cmd = fmt::format(
        "cd {} || exit 2; for f in * .[!.]* ..?*; do "
        "[ -e \"$f\" ] || continue; "
        "if [ -d \"$f\" ]; then printf 'd 0 %s\\n' \"$f\"; "
        "else printf 'f %s %s\\n' $(wc -c < \"$f\") \"$f\"; fi; done",
        shell_quote(path));
    auto r = run_command(host_, cmd);
    if (r.exit_code == 2) {
        return R::Err("No such directory: " + path, ErrorKind::PathNotFound);
    }
    if (r.failed()) {
        return R::Err(command_error(r, "Cannot list " + path), ErrorKind::Io);
    }

    std::vector<RemoteEntry> entries;
    for (const auto& line : split_lines(r.stdout_data)) {
        // kind, size, then the name (which may contain spaces)
        size_t sp1 = line.find(' ');
        size_t sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
        if (sp2 == std::string::npos) continue;
        RemoteEntry e;
        e.kind = line.compare(0, sp1, "d") == 0 ? EntryKind::Directory : EntryKind::File;
        e.size = static_cast<uint64_t>(std::strtoull(line.substr(sp1 + 1, sp2 - sp1 - 1).c_str(),
                                                     nullptr, 10));
        e.name = line.substr(sp2 + 1);
        entries.push_back(e);
    }
    return R::Ok(entries);
}

Result<void> ShellFs::mkdir_p(const std::string& path) {
    auto r = run_command(host_, "mkdir -p " + shell_quote(path));
    if (r.failed()) {
        return Result<void>::Err(command_error(r, "Cannot create directory " + path), ErrorKind::Io);
    }
    return Result<void>::Ok();
}

Result<void> ShellFs::download(const std::string& remote, const fs::path& local) {
    auto r = run_command(host_, "cat " + shell_quote(remote));
    if (r.failed()) {
        auto st = stat(remote);
        if (st.is_err() && st.kind == ErrorKind::PathNotFound) {
            return Result<void>::Err(st.error, st.kind);
        }
        return Result<void>::Err(command_error(r, "Cannot read " + remote), ErrorKind::Io);
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Cannot write " + local.string(), ErrorKind::Io);
    }
    out.write(r.stdout_data.data(), static_cast<std::streamsize>(r.stdout_data.size()));
    if (!out) {
        return Result<void>::Err("Write error on " + local.string(), ErrorKind::Io);
    }
    return Result<void>::Ok();
}

Result<void> ShellFs::upload(const fs::path& local, const std::string& remote) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return Result<void>::Err("Cannot read " + local.string(), ErrorKind::PathNotFound);
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::string target = shell_quote(remote);
    std::string part = shell_quote(remote + ".part");
    std::string cmd = fmt::format(
        "mkdir -p {dir} && cat > {part} && mv -f {part} {target} || {{ rc=$?; rm -f {part}; exit $rc; }}",
        fmt::arg("dir", shell_quote(remote_dirname(remote))),
        fmt::arg("part", part), fmt::arg("target", target));

    auto r = run_command(host_, cmd, data);
    if (r.failed()) {
        return Result<void>::Err(command_error(r, "Upload to " + remote + " failed"), ErrorKind::Io);
    }
    return Result<void>::Ok();
}

Result<std::string> ShellFs::raw_listing(const std::string& path) {
    auto r = run_command(host_, "ls -la " + shell_quote(path));
    if (r.failed()) {
        std::string detail = r.stderr_data;
        trim(detail);
        bool missing = detail.find("No such file") != std::string::npos;
        return Result<std::string>::Err(detail.empty() ? "Cannot list " + path : detail,
                                        missing ? ErrorKind::PathNotFound : ErrorKind::Io);
    }
    return Result<std::string>::Ok(r.stdout_data);
}
