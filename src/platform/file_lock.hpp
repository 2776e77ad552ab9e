#pragma once
#include <string>

// RAII advisory lock over a lock file (flock).
// Serializes read-modify-write sequences across independent processes.
// The lock is released when the object is destroyed or the process exits.
class FileLock {
public:
    // Blocks until the exclusive lock is acquired. Check held() after
    // construction; it is false only if the lock file could not be opened.
    explicit FileLock(const std::string& lock_path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};
