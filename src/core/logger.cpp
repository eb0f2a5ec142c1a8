#include "logger.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(const GlobalSettings& settings)
    : enabled_(settings.enable_logging),
      level_(settings.log_level),
      max_bytes_(parse_size(settings.max_log_size, 10 * 1024 * 1024)),
      max_files_(settings.max_log_files < 1 ? 1 : settings.max_log_files) {
    if (!enabled_) return;

    fs::path dir(settings.log_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        // Carry on without file logging rather than failing the operation
        enabled_ = false;
        return;
    }
    main_path_ = dir / "fleetsh.log";
    error_path_ = dir / "fleetsh-error.log";
    remote_path_ = dir / "fleetsh-remote.log";
}

Logger::~Logger() = default;

Logger Logger::disabled() {
    return Logger();
}

void Logger::debug(const std::string& msg)    { write(LogLevel::Debug, "DEBUG", msg); }
void Logger::info(const std::string& msg)     { write(LogLevel::Info, "INFO", msg); }
void Logger::warn(const std::string& msg)     { write(LogLevel::Warn, "WARN", msg); }
void Logger::error(const std::string& msg)    { write(LogLevel::Error, "ERROR", msg); }
void Logger::success(const std::string& msg)  { write(LogLevel::Info, "INFO", "SUCCESS: " + msg); }
void Logger::progress(const std::string& msg) { write(LogLevel::Info, "INFO", "PROGRESS: " + msg); }

void Logger::write(LogLevel level, const std::string& label, const std::string& msg) {
    if (console_ && level != LogLevel::Debug) console_(level, msg);
    if (!enabled_ || level < level_) return;

    std::string line = fmt::format("[{}] [{}] {}\n", now_stamp(), label, msg);
    append(main_path_, line);
    if (level == LogLevel::Error) append(error_path_, line);
}

void Logger::remote_line(const std::string& alias, const std::string& tag,
                         const std::string& line) {
    if (!enabled_) return;
    append(remote_path_, fmt::format("[{}] [{}] [{}] {}\n", now_stamp(), alias, tag, line));
}

void Logger::append(const fs::path& path, const std::string& line) {
    if (path.empty()) return;
    rotate_if_needed(path, line.size());
    std::ofstream out(path, std::ios::app | std::ios::binary);
    if (out) out << line;
}

// name -> name.1 -> ... -> name.<max_files>; the oldest falls off.
void Logger::rotate_if_needed(const fs::path& path, size_t incoming) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return;
    if (static_cast<int64_t>(size + incoming) <= max_bytes_) return;

    auto numbered = [&](int n) { return fs::path(path.string() + "." + std::to_string(n)); };

    fs::remove(numbered(max_files_), ec);
    for (int i = max_files_ - 1; i >= 1; i--) {
        if (fs::exists(numbered(i), ec))
            fs::rename(numbered(i), numbered(i + 1), ec);
    }
    fs::rename(path, numbered(1), ec);
}

// ── Log maintenance ───────────────────────────────────────────

std::optional<fs::path> log_file_path(const GlobalSettings& settings, const std::string& type) {
    fs::path dir(settings.log_dir);
    if (type == "main" || type == "all") return dir / "fleetsh.log";
    if (type == "error" || type == "errors") return dir / "fleetsh-error.log";
    if (type == "remote") return dir / "fleetsh-remote.log";
    return std::nullopt;
}

Result<std::string> tail_log(const fs::path& path, int lines) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err("Log file not found: " + path.string(),
                                        ErrorKind::PathNotFound);
    }

    if (lines <= 0) return Result<std::string>::Ok("");

    // Read backwards in chunks until enough newlines are buffered
    const std::streamoff chunk = 4096;
    in.seekg(0, std::ios::end);
    std::streamoff end = in.tellg();
    std::string data;
    int newlines = 0;
    while (end > 0 && newlines <= lines) {
        std::streamoff n = end < chunk ? end : chunk;
        end -= n;
        in.seekg(end);
        std::string buf(static_cast<size_t>(n), '\0');
        in.read(&buf[0], n);
        newlines += static_cast<int>(std::count(buf.begin(), buf.end(), '\n'));
        data.insert(0, buf);
    }

    // Keep the last `lines` lines (a trailing newline ends the last one)
    size_t pos = data.size();
    if (pos > 0 && data[pos - 1] == '\n') pos--;
    int seen = 0;
    while (pos > 0) {
        if (data[pos - 1] == '\n' && ++seen == lines) break;
        pos--;
    }
    return Result<std::string>::Ok(data.substr(pos));
}

Result<int> clear_logs(const GlobalSettings& settings, const std::string& type) {
    std::vector<std::string> names;
    if (type == "main") names = {"fleetsh.log"};
    else if (type == "error" || type == "errors") names = {"fleetsh-error.log"};
    else if (type == "remote") names = {"fleetsh-remote.log"};
    else if (type == "all") names = {"fleetsh.log", "fleetsh-error.log", "fleetsh-remote.log"};
    else return Result<int>::Err("Unknown log type: " + type, ErrorKind::ConfigMissing);

    fs::path dir(settings.log_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);

    int cleared = 0;
    for (const auto& name : names) {
        std::ofstream out(dir / name, std::ios::trunc);
        if (out) cleared++;
    }

    if (type == "all") {
        std::vector<fs::path> rotated;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::string fname = entry.path().filename().string();
            for (const auto& name : names) {
                if (fname.size() > name.size() + 1 &&
                    fname.compare(0, name.size() + 1, name + ".") == 0) {
                    rotated.push_back(entry.path());
                }
            }
        }
        for (const auto& p : rotated) {
            if (fs::remove(p, ec)) cleared++;
        }
    }

    if (cleared == 0) {
        return Result<int>::Err("Log file(s) not found", ErrorKind::PathNotFound);
    }
    return Result<int>::Ok(cleared);
}
