#include "SerialExecutor.h"
#include "services/logger/LogManager.h"

#include <exception>

namespace lmenu {

SerialExecutor::SerialExecutor() {
    worker_ = std::thread([this]() { run(); });
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

bool SerialExecutor::post(Task task) {
    return postDelayed(std::chrono::milliseconds(0), std::move(task));
}

bool SerialExecutor::postDelayed(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) {
            return false;
        }
        queue_.insert(Entry{Clock::now() + delay, nextSeq_++, std::move(task)});
    }
    cv_.notify_one();
    return true;
}

void SerialExecutor::waitIdle() {
    if (onWorkerThread()) {
        return;
    }
    std::unique_lock<std::mutex> lock(mu_);
    idleCv_.wait(lock, [&]() { return !running_ || (queue_.empty() && !busy_); });
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_ && !worker_.joinable()) {
            return;
        }
        running_ = false;
        queue_.clear();
    }
    cv_.notify_all();
    idleCv_.notify_all();
    if (worker_.joinable() && !onWorkerThread()) {
        worker_.join();
    }
}

bool SerialExecutor::onWorkerThread() const noexcept {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialExecutor::run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (running_) {
        if (queue_.empty()) {
            cv_.wait(lock, [&]() { return !running_ || !queue_.empty(); });
            continue;
        }
        auto first = queue_.begin();
        if (first->due > Clock::now()) {
            cv_.wait_until(lock, first->due);
            continue;
        }
        Task task = std::move(first->task);
        queue_.erase(first);
        busy_ = true;
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            logging::LogManager::error("Background task failed: {}", e.what());
        }
        lock.lock();
        busy_ = false;
        if (queue_.empty()) {
            idleCv_.notify_all();
        }
    }
}
}
