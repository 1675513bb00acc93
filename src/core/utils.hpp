#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Seconds since the epoch with sub-second resolution (trace timestamps).
double now_epoch();

// Strict 64-bit parse of a whole string; nullopt on junk or overflow.
std::optional<int64_t> parse_int64(const std::string& s);

// Left-pad with '0' up to width (no-op if already as long).
std::string zfill(const std::string& s, size_t width);

std::string to_lower(std::string s);

// Split on a delimiter, dropping empty fields.
std::vector<std::string> split(const std::string& str, char delimiter);

// "1b2c-..." → "1b2c..." (trace servers expect dashless GUIDs)
std::string strip_dashes(const std::string& s);

// n random lowercase hex digits
std::string random_hex(size_t n);

// Short host name of this machine, "" if unavailable.
std::string host_name();

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
