#pragma once

#include <string>
#include <cstdint>

// Format an age in seconds as "2h35m", "14m22s" or "8s".
// Returns "-" for negative ages (clock skew, future timestamps).
std::string format_age(int64_t seconds);

// Format a registration epoch as "YYYY-MM-DD HH:MM:SS".
// Returns "unknown" when the epoch is missing (<= 0).
std::string format_registered_at(int64_t epoch);
