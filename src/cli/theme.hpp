#pragma once

#include <string>
#include <fmt/format.h>

#define FLEETSH_VERSION "1.0.0"

namespace theme {

// Slate and amber (ANSI 24-bit escape sequences)
namespace color {
    const std::string SLATE     = "\033[38;2;86;124;150m";
    const std::string AMBER     = "\033[38;2;196;140;48m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string slate(const std::string& s)   { return color::SLATE + s + color::RESET; }
inline std::string amber(const std::string& s)   { return color::AMBER + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 44) {
    std::string line;
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title, version, rule. Unlike a REPL banner this never clears the screen.
inline std::string banner() {
    return "\n" + color::SLATE + color::BOLD + "  fleetsh\n"
         + color::RESET + color::DIM + "  v" FLEETSH_VERSION "  remote host management over SSH"
         + color::RESET + "\n\n" + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::SLATE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Subtle line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

} // namespace theme
