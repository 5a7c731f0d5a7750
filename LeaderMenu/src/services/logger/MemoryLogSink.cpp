#include "MemoryLogSink.h"

namespace lmenu::logging {

MemoryLogBuffer& MemoryLogBuffer::instance() {
    static MemoryLogBuffer buf;
    return buf;
}

void MemoryLogBuffer::push(LogEntry e) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (capacity_ == 0) return;
    if (entries_.size() >= capacity_) {
        const size_t to_drop = entries_.size() - capacity_ + 1;
        entries_.erase(entries_.begin(), entries_.begin() + (std::ptrdiff_t)to_drop);
    }
    entries_.emplace_back(std::move(e));
}

void MemoryLogBuffer::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
}

void MemoryLogBuffer::setCapacity(size_t cap) {
    std::lock_guard<std::mutex> lock(mtx_);
    capacity_ = cap;
    if (entries_.size() > capacity_) {
        entries_.erase(entries_.begin(), entries_.begin() + (std::ptrdiff_t)(entries_.size() - capacity_));
    }
}

size_t MemoryLogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

void MemoryLogBuffer::snapshot(std::vector<LogEntry>& out) const {
    std::lock_guard<std::mutex> lock(mtx_);
    out = entries_;
}

std::shared_ptr<spdlog::sinks::sink> create_memory_sink() {
    return std::make_shared<memory_sink_mt>();
}

} // namespace lmenu::logging
