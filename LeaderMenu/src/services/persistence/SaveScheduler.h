#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace lmenu {

class SerialExecutor;

// Cancel-and-restart debounce. Each schedule() supersedes the previous one;
// only the most recent callback fires, once the window passes without a new
// schedule().
class SaveScheduler {
public:
    SaveScheduler(SerialExecutor& executor, std::chrono::milliseconds window);

    // `flush` runs on the executor thread.
    void schedule(std::function<void()> flush);
    void cancel();

    [[nodiscard]] bool pending() const noexcept;
    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }
    void setWindow(std::chrono::milliseconds window) noexcept { window_ = window; }

private:
    struct Token {
        std::atomic<std::uint64_t> generation{0};
        std::atomic<bool> pending{false};
    };

    SerialExecutor& executor_;
    std::chrono::milliseconds window_;
    std::shared_ptr<Token> token_ = std::make_shared<Token>();
};
}
