#include "session/log_ring.hpp"

#include <algorithm>
#include <chrono>

namespace toolhub::session {

LogRing::LogRing(const std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

void LogRing::append(const protocol::LogStream stream, const std::string& text) {
    protocol::LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.stream = stream;
    entry.text = text;

    std::lock_guard<std::mutex> lock(mutex_);
    entry.sequence = next_sequence_++;
    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_front();
        ++dropped_;
    }
}

std::vector<protocol::LogEntry> LogRing::tail(const std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t count =
        limit == 0 ? entries_.size() : std::min(limit, entries_.size());
    return std::vector<protocol::LogEntry>(entries_.end() - static_cast<std::ptrdiff_t>(count),
                                           entries_.end());
}

std::size_t LogRing::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t LogRing::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

}  // namespace toolhub::session
