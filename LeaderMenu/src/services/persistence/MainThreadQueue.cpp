#include "MainThreadQueue.h"
#include "services/logger/LogManager.h"

#include <exception>

namespace lmenu {

void MainThreadQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_all();
}

std::size_t MainThreadQueue::drain() {
    std::size_t ran = 0;
    for (;;) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (tasks_.empty()) {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            logging::LogManager::error("Main queue task failed: {}", e.what());
        }
        ++ran;
    }
    return ran;
}

std::size_t MainThreadQueue::waitAndDrain(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, timeout, [&]() { return !tasks_.empty(); });
    }
    return drain();
}

std::size_t MainThreadQueue::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
}
}
