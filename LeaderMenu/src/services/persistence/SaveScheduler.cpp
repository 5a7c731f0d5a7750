#include "SaveScheduler.h"
#include "SerialExecutor.h"

namespace lmenu {

SaveScheduler::SaveScheduler(SerialExecutor& executor, std::chrono::milliseconds window)
    : executor_(executor), window_(window) {}

void SaveScheduler::schedule(std::function<void()> flush) {
    const std::uint64_t gen = ++token_->generation;
    token_->pending = true;
    std::weak_ptr<Token> weak = token_;
    executor_.postDelayed(window_, [weak, gen, flush = std::move(flush)]() {
        auto token = weak.lock();
        if (!token || token->generation.load() != gen) {
            return;
        }
        token->pending = false;
        flush();
    });
}

void SaveScheduler::cancel() {
    ++token_->generation;
    token_->pending = false;
}

bool SaveScheduler::pending() const noexcept {
    return token_->pending.load();
}
}
