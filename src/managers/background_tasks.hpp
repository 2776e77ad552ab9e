#pragma once

#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <functional>

// Fire-and-forget housekeeping (sweeps, cache pruning) on worker threads.
// A failing task is logged and never reaches the caller. The destructor
// waits for everything still running.
class BackgroundTasks {
public:
    using Task = std::function<void()>;

    BackgroundTasks() = default;
    ~BackgroundTasks();

    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;

    void submit(const std::string& name, Task task);

    // Join every submitted task.
    void wait_all();

private:
    std::vector<std::thread> threads_;
    std::mutex mutex_;

    static void run(std::string name, Task task);
};
