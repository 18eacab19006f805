#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "protocol/provider_contract.hpp"

namespace toolhub::session {

// Bounded, thread-safe buffer of provider output. Oldest lines are evicted
// first once capacity is reached.
class LogRing {
public:
    explicit LogRing(std::size_t capacity = 1000);

    void append(protocol::LogStream stream, const std::string& text);

    // The newest `limit` entries, oldest first. 0 returns everything.
    std::vector<protocol::LogEntry> tail(std::size_t limit = 0) const;

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::size_t dropped() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<protocol::LogEntry> entries_;
    std::size_t dropped_ = 0;
    std::uint64_t next_sequence_ = 1;
};

}  // namespace toolhub::session
