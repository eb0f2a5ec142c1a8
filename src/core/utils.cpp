#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fmt/format.h>

std::string now_stamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

int64_t parse_size(const std::string& s, int64_t fallback) {
    std::string v = s;
    trim(v);
    if (v.empty()) return fallback;

    int64_t mult = 1;
    char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(v.back())));
    if (suffix == 'K') mult = 1024;
    else if (suffix == 'M') mult = 1024 * 1024;
    else if (suffix == 'G') mult = 1024LL * 1024 * 1024;
    if (mult != 1) v.pop_back();

    try {
        size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != v.size() || n <= 0) return fallback;
        return n * mult;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string human_size(int64_t nbytes) {
    static const char* suffixes[] = {"B", "KB", "MB", "GB", "TB"};
    double f = static_cast<double>(nbytes);
    int i = 0;
    while (f >= 1024.0 && i < 4) {
        f /= 1024.0;
        i++;
    }
    if (i == 0) return fmt::format("{}B", nbytes);
    return fmt::format("{:.1f}{}", f, suffixes[i]);
}

std::string shell_quote(const std::string& s) {
    if (!s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) ||
                   c == '_' || c == '-' || c == '.' || c == '/' ||
                   c == '=' || c == ':' || c == ',' || c == '+' || c == '@';
        })) {
        return s;
    }
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\"'\"'";
        else out += c;
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += shell_quote(w);
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string cur;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (c == '\n') {
            lines.push_back(cur);
            cur.clear();
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') continue;
            lines.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) lines.push_back(cur);
    return lines;
}

bool iless(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) <
                   std::tolower(static_cast<unsigned char>(y));
        });
}
