#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace lmenu {

// Tasks handed back to the primary context. Any thread may post; only the
// owner of the primary context calls drain().
class MainThreadQueue {
public:
    using Task = std::function<void()>;

    void post(Task task);

    // Runs queued tasks, including ones posted while draining. Returns how many ran.
    std::size_t drain();

    // Waits up to `timeout` for a task to arrive, then drains.
    std::size_t waitAndDrain(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
};
}
