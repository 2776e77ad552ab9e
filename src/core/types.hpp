#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Failure categories surfaced by the connection and cache layers.
enum class ErrorKind {
    None,
    InvalidTargetFormat,
    ConnectionNotFound,
    ConnectionUnhealthy,
    ConnectionTimeout,
    ConnectionFailed,
    CacheWriteFailed,
    CacheCorrupt,
    CacheMiss,
    InvalidDeviceType,
    RegistryIOError,
    NoLastTarget,
    ConfigError,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Output of a process run through the ssh client
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Decomposed user@host[:port]
struct SshTarget {
    std::string user;
    std::string host;
    int port = 22;
    std::string raw;                 // exact caller spelling, used for keying
};

struct SshSettings {
    std::string control_dir;
    std::string binary = "ssh";
    int timeout = 10;                // -O check / command ConnectTimeout
    int connect_timeout = 30;        // master ConnectTimeout
    int control_persist = 600;       // ControlPersist seconds
    int max_connections = 10;
};

struct CacheSettings {
    std::string dir;
    int64_t expiry_secs = 86400;
    int max_size = 1000;
};

