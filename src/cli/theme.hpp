#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences, suppressed when stdout is not a terminal
inline bool use_color() {
    static const bool tty = isatty(STDOUT_FILENO) != 0;
    return tty;
}

namespace color {
    inline std::string paint(const char* code) { return use_color() ? code : ""; }
    inline std::string BLUE()   { return paint("\033[38;2;62;120;178m"); }
    inline std::string RED()    { return paint("\033[91m"); }
    inline std::string GREEN()  { return paint("\033[92m"); }
    inline std::string BOLD()   { return paint("\033[1m"); }
    inline std::string DIM()    { return paint("\033[2m"); }
    inline std::string RESET()  { return paint("\033[0m"); }
}

inline std::string bold(const std::string& s)   { return color::BOLD() + s + color::RESET(); }
inline std::string dim(const std::string& s)    { return color::DIM() + s + color::RESET(); }

// Section header, padded with blank lines
inline std::string section(const std::string& title) {
    return "\n" + color::BLUE() + color::BOLD() + "  " + title + color::RESET() + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN() + "    + " + color::RESET() + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED() + "    x " + color::RESET() + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE() + "    ~ " + color::RESET() + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::DIM() + "    > " + color::RESET() + msg + "\n";
}

// Key-value row for summaries
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM() + fmt::format("    {:<12}", key) + color::RESET() + value + "\n";
}

} // namespace theme
