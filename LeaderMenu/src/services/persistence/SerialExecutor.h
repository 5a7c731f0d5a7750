#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <thread>

namespace lmenu {

// One background worker running tasks in deadline order (FIFO for equal
// deadlines). Used for all file I/O so the primary context never blocks.
class SerialExecutor {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    SerialExecutor();
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    // False once shut down; the task is dropped.
    bool post(Task task);
    bool postDelayed(std::chrono::milliseconds delay, Task task);

    // Blocks until no task is queued or running. Delayed tasks count as queued.
    void waitIdle();

    // Drops queued tasks and joins the worker. Idempotent.
    void shutdown();

    [[nodiscard]] bool onWorkerThread() const noexcept;

private:
    struct Entry {
        Clock::time_point due;
        std::uint64_t seq;
        mutable Task task;

        bool operator<(const Entry& other) const noexcept {
            return due != other.due ? due < other.due : seq < other.seq;
        }
    };

    void run();

    std::thread worker_;
    std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::set<Entry> queue_;
    std::uint64_t nextSeq_ = 0;
    bool running_ = true;
    bool busy_ = false;
};
}
