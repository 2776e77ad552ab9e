#include "file_lock.hpp"
#include <filesystem>
#include <cerrno>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

FileLock::FileLock(const std::string& lock_path) {
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path(), ec);

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd_ < 0) return;
    while (flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        close(fd_);
        fd_ = -1;
        return;
    }
}

FileLock::~FileLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released automatically when fd is closed
}
