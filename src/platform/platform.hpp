#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Local machine name, or "localhost" if it cannot be determined.
std::string hostname();

// True if path is a regular file the current user may execute.
bool is_executable(const std::filesystem::path& path);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
