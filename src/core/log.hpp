#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <unistd.h>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log path: $HOSTMUX_LOG_FILE, else <tmp>/hostmux_debug.log
inline std::string hostmux_log_path() {
    static std::string path = [] {
        const char* env = std::getenv("HOSTMUX_LOG_FILE");
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / "hostmux_debug.log").string();
    }();
    return path;
}

// One line per call: "[HH:MM:SS.mmm pid] msg". The CLI and its detached
// housekeeping helper append to the same file, so the pid tells them apart.
inline void hostmux_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02}:{:02}:{:02}.{:03} {}] {}\n", tm_buf.tm_hour,
                                   tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), getpid(), msg);
    std::ofstream out(hostmux_log_path(), std::ios::app);
    if (!out) return;
    out << line;
}

inline void hostmux_log_ssh(const std::string& label, const std::string& cmd,
                            const SSHResult& r) {
    hostmux_log(fmt::format("{} CMD: {}", label, cmd));
    hostmux_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                            r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        hostmux_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
