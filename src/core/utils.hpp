#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

// Local timestamp (YYYY-MM-DD HH:MM:SS) used in log lines.
std::string now_stamp();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Parse "<n>[K|M|G]" into bytes. Returns fallback when malformed.
int64_t parse_size(const std::string& s, int64_t fallback);

// 1536 -> "1.5KB"
std::string human_size(int64_t nbytes);

// Quote a word for a POSIX shell ('...' with embedded quotes escaped).
std::string shell_quote(const std::string& s);

// Quote each word and join with single spaces.
std::string shell_join(const std::vector<std::string>& words);

// Split on any of \n, \r\n. A trailing newline does not yield an empty line.
std::vector<std::string> split_lines(const std::string& text);

// Case-insensitive ASCII compare, returns true if a < b.
bool iless(const std::string& a, const std::string& b);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
