#pragma once

#include <condition_variable>
#include <deque>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lmenu {

// Lines typed on the terminal. A reader thread pushes them; the primary
// context takes them, so blocking on input never stalls the main queue.
class ConsoleInput {
public:
    void push(std::string line);
    // No more lines will arrive. Lines already queued stay readable.
    void close();

    [[nodiscard]] std::optional<std::string> tryNext();
    // Blocks until a line arrives; std::nullopt once closed and empty.
    [[nodiscard]] std::optional<std::string> next();
    [[nodiscard]] bool exhausted() const;

    // Feeds `in` into `input` from a detached thread until end of input.
    // `in` must live until the process exits (std::cin).
    static void startReader(std::shared_ptr<ConsoleInput> input, std::istream& in);

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::string> lines_;
    bool closed_{false};
};

} // namespace lmenu
