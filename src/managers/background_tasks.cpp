#include "background_tasks.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

BackgroundTasks::~BackgroundTasks() {
    wait_all();
}

void BackgroundTasks::submit(const std::string& name, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    threads_.emplace_back(&BackgroundTasks::run, name, std::move(task));
}

void BackgroundTasks::wait_all() {
    std::vector<std::thread> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(threads_);
    }
    for (auto& t : local) {
        if (t.joinable()) t.join();
    }
}

void BackgroundTasks::run(std::string name, Task task) {
    try {
        task();
    } catch (const std::exception& e) {
        hostmux_log(fmt::format("background {}: {}", name, e.what()));
    }
}
