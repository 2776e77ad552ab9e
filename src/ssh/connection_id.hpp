#pragma once

#include <string>

// Stable identifier for a target: lowercase hex MD5 of the exact string.
// No normalization; "root@h" and "root@h:22" get different ids.
// Returns "" for empty input (callers validate targets first).
std::string connection_id(const std::string& target);

// Width of every non-empty id.
constexpr size_t CONNECTION_ID_LEN = 32;

// True for a 32-char lowercase hex string.
bool is_connection_id(const std::string& s);
