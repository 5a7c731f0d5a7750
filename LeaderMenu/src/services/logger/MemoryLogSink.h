#pragma once
#include <vector>
#include <string>
#include <mutex>
#include <memory>
#include <chrono>
#include <spdlog/common.h>
#include <spdlog/sinks/base_sink.h>

namespace lmenu::logging {

struct LogEntry {
    spdlog::level::level_enum level;
    std::chrono::system_clock::time_point time;
    std::string message;
};

// Bounded in-process history of formatted log lines (oldest dropped first).
class MemoryLogBuffer {
public:
    void push(LogEntry e);
    void clear();
    void setCapacity(size_t cap);
    size_t size() const;
    void snapshot(std::vector<LogEntry>& out) const; // copy under lock

    static MemoryLogBuffer& instance();

private:
    mutable std::mutex mtx_;
    std::vector<LogEntry> entries_;
    size_t capacity_ = 2000;
};

template <typename Mutex>
class memory_sink : public spdlog::sinks::base_sink<Mutex> {
protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);
        LogEntry e;
        e.level = msg.level;
        e.time = std::chrono::system_clock::now();
        e.message.assign(formatted.data(), formatted.size());
        while (!e.message.empty() && (e.message.back() == '\n' || e.message.back() == '\r')) {
            e.message.pop_back();
        }
        MemoryLogBuffer::instance().push(std::move(e));
    }
    void flush_() override {}
};

using memory_sink_mt = memory_sink<std::mutex>;

std::shared_ptr<spdlog::sinks::sink> create_memory_sink();

} // namespace lmenu::logging
