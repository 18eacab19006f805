#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/toolhub_errors.hpp"

namespace toolhub::transport {

// Maps outstanding request ids to the caller blocked on them. Readers call
// resolve() from their own thread; callers block in wait() until the
// response, the deadline, or close().
class RequestCorrelator {
public:
    // Monotonic per instance; never reuses an id.
    std::int64_t next_id();

    core::errors::Result<core::errors::Unit> register_request(
        std::int64_t id, std::chrono::milliseconds timeout);

    // False when nobody is waiting for `id` (late or unsolicited response).
    bool resolve(std::int64_t id, nlohmann::json response);

    // Fails one request without waiting, e.g. when sending it failed.
    bool fail(std::int64_t id, const core::errors::ToolhubError& error);

    // Blocks until the slot completes or its deadline passes. The entry is
    // removed in every case.
    core::errors::Result<nlohmann::json> wait(std::int64_t id);

    // Fails every outstanding request and rejects new registrations.
    void close(const core::errors::ToolhubError& reason);

    bool is_closed() const;
    std::size_t pending_count() const;

private:
    struct PendingRequest {
        std::chrono::steady_clock::time_point deadline;
        bool done = false;
        std::optional<nlohmann::json> response;
        std::optional<core::errors::ToolhubError> error;
    };

    std::atomic<std::int64_t> next_id_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::int64_t, std::shared_ptr<PendingRequest>> pending_;
    std::optional<core::errors::ToolhubError> closed_reason_;
};

}  // namespace toolhub::transport
