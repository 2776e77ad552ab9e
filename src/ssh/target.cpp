#include "target.hpp"
#include <algorithm>
#include <cctype>

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

Result<SshTarget> parse_target(const std::string& raw) {
    auto bad = [&](const std::string& why) {
        return Result<SshTarget>::Err(ErrorKind::InvalidTargetFormat,
                                      "Invalid SSH target '" + raw + "': " + why);
    };

    if (raw.empty()) return bad("empty (expected user@host[:port])");

    auto at_count = std::count(raw.begin(), raw.end(), '@');
    if (at_count == 0) return bad("missing '@' (expected user@host[:port])");
    if (at_count > 1) return bad("only one '@' is allowed");

    if (raw.find_first_of(" \t\r\n") != std::string::npos) {
        return bad("whitespace is not allowed");
    }

    auto at = raw.find('@');
    SshTarget target;
    target.raw = raw;
    target.user = raw.substr(0, at);
    std::string host_part = raw.substr(at + 1);

    if (target.user.empty()) return bad("user must not be empty");

    auto colon = host_part.rfind(':');
    if (colon != std::string::npos) {
        if (host_part.find(':') != colon) return bad("host must not contain ':'");
        target.host = host_part.substr(0, colon);
        std::string port = host_part.substr(colon + 1);
        // Bound the length before converting so huge digit runs cannot overflow
        if (!all_digits(port) || port.size() > 5) return bad("port must be 1-65535");
        int value = std::stoi(port);
        if (value < 1 || value > 65535) return bad("port must be 1-65535");
        target.port = value;
    } else {
        target.host = host_part;
        target.port = 22;
    }

    if (target.host.empty()) return bad("host must not be empty");

    return Result<SshTarget>::Ok(target);
}

std::string ssh_destination(const SshTarget& target) {
    return target.user + "@" + target.host;
}
