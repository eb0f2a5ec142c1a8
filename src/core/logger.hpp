#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "types.hpp"

// Per-invocation logging context. Constructed once from the settings and
// passed by reference into each operation; files are opened per write in
// append mode so independent processes can share them.
//
//   fleetsh.log         every message at or above the configured level
//   fleetsh-error.log   ERROR only
//   fleetsh-remote.log  "[ts] [alias] [tag] line" for remote output
class Logger {
public:
    // Console echo (the CLI installs a themed printer; tests capture).
    using ConsoleSink = std::function<void(LogLevel, const std::string&)>;

    explicit Logger(const GlobalSettings& settings);
    ~Logger();

    // A logger that writes nothing to disk.
    static Logger disabled();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = default;
    Logger& operator=(Logger&&) = default;

    void set_console(ConsoleSink sink) { console_ = std::move(sink); }

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);
    void success(const std::string& msg);
    void progress(const std::string& msg);

    // One line of remote output. Goes to the remote log only.
    void remote_line(const std::string& alias, const std::string& tag,
                     const std::string& line);

    bool enabled() const { return enabled_; }
    const std::filesystem::path& main_path() const { return main_path_; }
    const std::filesystem::path& error_path() const { return error_path_; }
    const std::filesystem::path& remote_path() const { return remote_path_; }

private:
    Logger() = default;

    bool enabled_ = false;
    LogLevel level_ = LogLevel::Info;
    int64_t max_bytes_ = 10 * 1024 * 1024;
    int max_files_ = 5;
    std::filesystem::path main_path_;
    std::filesystem::path error_path_;
    std::filesystem::path remote_path_;
    ConsoleSink console_;

    void write(LogLevel level, const std::string& label, const std::string& msg);
    void append(const std::filesystem::path& path, const std::string& line);
    void rotate_if_needed(const std::filesystem::path& path, size_t incoming);
};

const char* log_level_name(LogLevel level);

// Path of a named log ("main", "error"/"errors", "remote"); nullopt if unknown.
std::optional<std::filesystem::path> log_file_path(const GlobalSettings& settings,
                                                   const std::string& type);

// Last n lines of a file.
Result<std::string> tail_log(const std::filesystem::path& path, int lines);

// Truncate logs of the given type ("all" also removes rotations).
// Returns the number of files touched.
Result<int> clear_logs(const GlobalSettings& settings, const std::string& type);
