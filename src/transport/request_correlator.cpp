#include "transport/request_correlator.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolhub::transport {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;
using core::errors::Unit;

std::int64_t RequestCorrelator::next_id() {
    return next_id_.fetch_add(1) + 1;
}

core::errors::Result<Unit> RequestCorrelator::register_request(
    const std::int64_t id, const std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_reason_.has_value()) {
        return *closed_reason_;
    }
    if (pending_.find(id) != pending_.end()) {
        LOG_ERROR("RequestCorrelator: id " + std::to_string(id) + " is already pending");
        return ToolhubError{ErrorCategory::Internal,
                            "Request id collision: " + std::to_string(id),
                            "request_id_collision"};
    }

    auto slot = std::make_shared<PendingRequest>();
    slot->deadline = std::chrono::steady_clock::now() + timeout;
    pending_.emplace(id, std::move(slot));
    return Unit{};
}

bool RequestCorrelator::resolve(const std::int64_t id, nlohmann::json response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end() || it->second->done) {
            return false;
        }
        it->second->response = std::move(response);
        it->second->done = true;
    }
    cv_.notify_all();
    return true;
}

bool RequestCorrelator::fail(const std::int64_t id, const ToolhubError& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end() || it->second->done) {
            return false;
        }
        it->second->error = error;
        it->second->done = true;
    }
    cv_.notify_all();
    return true;
}

core::errors::Result<nlohmann::json> RequestCorrelator::wait(const std::int64_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return ToolhubError{ErrorCategory::Internal,
                            "No pending request with id " + std::to_string(id),
                            "request_not_pending"};
    }
    const std::shared_ptr<PendingRequest> slot = it->second;

    const bool completed =
        cv_.wait_until(lock, slot->deadline, [&slot]() { return slot->done; });
    pending_.erase(id);

    if (!completed) {
        return ToolhubError{ErrorCategory::RequestTimeout,
                            "Request " + std::to_string(id) + " timed out",
                            "request_timeout"};
    }
    if (slot->error.has_value()) {
        return *slot->error;
    }
    return std::move(*slot->response);
}

void RequestCorrelator::close(const ToolhubError& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_reason_.has_value()) {
            closed_reason_ = reason;
        }
        for (auto& entry : pending_) {
            if (!entry.second->done) {
                entry.second->error = reason;
                entry.second->done = true;
            }
        }
    }
    cv_.notify_all();
}

bool RequestCorrelator::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_reason_.has_value();
}

std::size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

}  // namespace toolhub::transport
