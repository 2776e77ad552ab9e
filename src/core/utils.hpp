#pragma once

#include <string>
#include <ctime>
#include <cstdint>

// Seconds since the Unix epoch.
int64_t now_epoch();

// Format epoch seconds as local "YYYY-MM-DD HH:MM:SS".
std::string format_epoch(int64_t epoch);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Lowercase copy (ASCII only).
std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
