#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cctype>
#include <random>
#include <sstream>
#include <unistd.h>

double now_epoch() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

std::optional<int64_t> parse_int64(const std::string& s) {
    if (s.empty()) return std::nullopt;
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) return std::nullopt;
        return static_cast<int64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string zfill(const std::string& s, size_t width) {
    if (s.size() >= width) return s;
    return std::string(width - s.size(), '0') + s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream stream(str);
    std::string item;
    while (std::getline(stream, item, delimiter)) {
        trim(item);
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

std::string strip_dashes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '-') out += c;
    }
    return out;
}

std::string random_hex(size_t n) {
    static std::mt19937_64 rng(std::random_device{}());
    static const char HEX[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(n);
    for (size_t i = 0; i < n; i++) out += HEX[dist(rng)];
    return out;
}

std::string host_name() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return "";
    return std::string(buf);
}
