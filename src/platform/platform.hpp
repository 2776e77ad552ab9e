#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Absolute path of the running executable, empty when it cannot be resolved.
std::filesystem::path self_exe();

// Expands a leading "~/" to the home directory.
std::filesystem::path expand_home(const std::string& path);

// Unique temp path beside `dest` (same directory, so rename() stays atomic).
std::filesystem::path sibling_temp(const std::filesystem::path& dest);

// Write `content` to a sibling temp file, then rename it over `dest`.
// Readers never observe a partial file. On failure `dest` is untouched,
// the temp file is removed, and false is returned.
bool write_file_atomic(const std::filesystem::path& dest, const std::string& content);

// Create a directory (and parents) restricted to the owner (0700).
bool ensure_private_dir(const std::filesystem::path& dir);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
