#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "transport/http_client.hpp"
#include "transport/transport.hpp"

namespace toolhub::transport {

struct EventStreamOptions {
    http_client::Url base_url;
    std::optional<std::string> credential;
    std::string client_id;
    std::string rpc_path = "/jsonrpc";
    std::string event_path = "/sse/";
    std::chrono::milliseconds reconnect_initial{1000};
    std::chrono::milliseconds reconnect_max{5000};
};

// Requests go out as HTTP POSTs; replies come back either in the POST body
// or on a long-lived GET push channel keyed by the client id.
class EventStreamTransport : public Transport {
public:
    EventStreamTransport(EventStreamOptions options, RequestTimeouts timeouts, LineSink sink);
    ~EventStreamTransport() override;

    bool is_connected() const override;
    void close() override;
    std::string kind_name() const override { return "event-stream"; }

    // True while the push channel is attached.
    bool stream_attached() const { return stream_attached_.load(); }
    const std::string& client_id() const { return options_.client_id; }

protected:
    core::errors::Result<std::optional<nlohmann::json>> send_message(
        const nlohmann::json& message, std::chrono::milliseconds timeout) override;

private:
    void listener_loop();
    // Returns when the stream drops or stop is requested; true if the
    // channel was attached at some point.
    bool consume_stream();
    void handle_event_line(std::string line);
    bool sleep_unless_stopped(std::chrono::milliseconds delay);
    http_client::Headers base_headers() const;

    EventStreamOptions options_;
    LineSink sink_;

    std::atomic_bool stop_{false};
    std::atomic_bool closed_{false};
    std::atomic_bool stream_attached_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::thread listener_;
};

}  // namespace toolhub::transport
