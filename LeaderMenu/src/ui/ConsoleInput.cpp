#include "ui/ConsoleInput.h"

#include <istream>
#include <thread>

namespace lmenu {

void ConsoleInput::push(std::string line) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        lines_.push_back(std::move(line));
    }
    cv_.notify_all();
}

void ConsoleInput::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<std::string> ConsoleInput::tryNext() {
    std::lock_guard<std::mutex> lock(mu_);
    if (lines_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

std::optional<std::string> ConsoleInput::next() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [&]() { return closed_ || !lines_.empty(); });
    if (lines_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

bool ConsoleInput::exhausted() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_ && lines_.empty();
}

void ConsoleInput::startReader(std::shared_ptr<ConsoleInput> input, std::istream& in) {
    // getline cannot be interrupted, so the thread is never joined.
    std::thread([input = std::move(input), &in]() {
        std::string line;
        while (std::getline(in, line)) {
            input->push(line);
        }
        input->close();
    }).detach();
}

} // namespace lmenu
