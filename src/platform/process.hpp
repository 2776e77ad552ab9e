#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Non-blocking reap. Returns true once the child has exited and stores
    // its exit code (-1 when killed by a signal). Safe to call repeatedly.
    bool try_wait(int& exit_code);

    // Terminate the process (SIGTERM, then SIGKILL after 2s) and reap it.
    void terminate();

private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stderr_log,
                               bool detach);
};

// Spawn a child process with stdin closed.
// stderr_log: if non-empty, redirect child's stderr to this file (append mode).
// detach: start a new session and send stdout to /dev/null, so the child
//         outlives the caller's terminal and never holds the caller's pipes.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log = "",
                    bool detach = false);

// Run a program to completion, capturing stdout and stderr.
// timeout_ms <= 0 waits indefinitely. On timeout the child is killed and
// exit_code is -1. A program that cannot be executed yields exit code 127.
SSHResult run_capture(const std::string& program,
                      const std::vector<std::string>& args,
                      int timeout_ms = 0);

} // namespace platform
