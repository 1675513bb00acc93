#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory (TMPDIR or /tmp).
std::filesystem::path temp_dir();

// Value of an environment variable, or "" if unset.
std::string env(const std::string& name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
