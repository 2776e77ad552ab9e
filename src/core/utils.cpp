#include "utils.hpp"
#include "types.hpp"
#include <chrono>
#include <cctype>
#include <algorithm>
#include <stdexcept>

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string format_epoch(int64_t epoch) {
    std::time_t t = static_cast<std::time_t>(epoch);
    struct tm tm_buf;
    if (!localtime_r(&t, &tm_buf)) return "unknown";
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::InvalidTargetFormat: return "InvalidTargetFormat";
        case ErrorKind::ConnectionNotFound:  return "ConnectionNotFound";
        case ErrorKind::ConnectionUnhealthy: return "ConnectionUnhealthy";
        case ErrorKind::ConnectionTimeout:   return "ConnectionTimeout";
        case ErrorKind::ConnectionFailed:    return "ConnectionFailed";
        case ErrorKind::CacheWriteFailed:    return "CacheWriteFailed";
        case ErrorKind::CacheCorrupt:        return "CacheCorrupt";
        case ErrorKind::CacheMiss:           return "CacheMiss";
        case ErrorKind::InvalidDeviceType:   return "InvalidDeviceType";
        case ErrorKind::RegistryIOError:     return "RegistryIOError";
        case ErrorKind::NoLastTarget:        return "NoLastTarget";
        case ErrorKind::ConfigError:         return "ConfigError";
    }
    return "Unknown";
}
