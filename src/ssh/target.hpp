#pragma once

#include <string>
#include <core/types.hpp>

// Parse and validate "user@host[:port]".
// Fails with InvalidTargetFormat on zero or multiple '@', empty user or host,
// or a port that is not an integer in [1, 65535]. No side effects.
Result<SshTarget> parse_target(const std::string& raw);

// "user@host" as passed to the ssh client (port goes to -p).
std::string ssh_destination(const SshTarget& target);
