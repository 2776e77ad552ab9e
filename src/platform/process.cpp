#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>

namespace platform {

static int decode_status(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// Built before fork(); the child must not allocate.
static std::vector<const char*> make_argv(const std::string& program,
                                          const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    return argv;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.reaped_ = false;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::try_wait(int& exit_code) {
    if (pid_ <= 0) return false;
    if (reaped_) {
        exit_code = exit_code_;
        return true;
    }
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
        exit_code = exit_code_;
        return true;
    }
    return false;  // 0 means still running
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    int code;
    for (int i = 0; i < 20; i++) {
        if (try_wait(code)) return;
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        reaped_ = true;
        exit_code_ = -1;
    }
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log,
                    bool detach) {
    ProcessHandle handle;
    auto argv = make_argv(program, args);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (detach) dup2(devnull, STDOUT_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        } else {
            close(STDIN_FILENO);
        }

        if (detach) setsid();

        if (!stderr_log.empty()) {
            int fd = open(stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
            if (fd >= 0 && fd != STDERR_FILENO) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

SSHResult run_capture(const std::string& program,
                      const std::vector<std::string>& args,
                      int timeout_ms) {
    SSHResult result{-1, "", ""};

    // Close-on-exec so a process forked concurrently from another thread
    // never holds a write end open; dup2 below clears the flag on 1 and 2.
    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.stderr_data = "pipe() failed";
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        result.stderr_data = "pipe() failed";
        return result;
    }

    auto argv = make_argv(program, args);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        result.stderr_data = "fork() failed";
        return result;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    int open_fds = 2;
    bool timed_out = false;
    char buf[4096];

    while (open_fds > 0) {
        int wait_ms = -1;
        if (timeout_ms > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) { timed_out = true; break; }
            wait_ms = static_cast<int>(left);
        }

        int pr = poll(fds, 2, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;  // deadline re-checked at loop top

        for (auto& pfd : fds) {
            if (pfd.fd < 0 || !(pfd.revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(pfd.fd, buf, sizeof(buf));
            if (n > 0) {
                auto& sink = (pfd.fd == out_pipe[0]) ? result.stdout_data : result.stderr_data;
                sink.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(pfd.fd);
                pfd.fd = -1;
                open_fds--;
            }
        }
    }

    if (fds[0].fd >= 0) close(fds[0].fd);
    if (fds[1].fd >= 0) close(fds[1].fd);

    if (timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        result.exit_code = -1;
        result.stderr_data += "Command timed out after " + std::to_string(timeout_ms / 1000) + "s";
        return result;
    }

    int status;
    if (waitpid(pid, &status, 0) == pid) {
        result.exit_code = decode_status(status);
    }
    return result;
}

} // namespace platform
