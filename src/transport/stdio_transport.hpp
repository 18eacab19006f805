#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include "transport/transport.hpp"

namespace toolhub::transport {

// Newline-delimited JSON over a child's standard streams. Takes ownership of
// the three descriptors; one reader thread drains stdout and stderr.
class StdioTransport : public Transport {
public:
    StdioTransport(int stdin_fd, int stdout_fd, int stderr_fd, RequestTimeouts timeouts,
                   LineSink sink);
    ~StdioTransport() override;

    bool is_connected() const override;
    void close() override;
    std::string kind_name() const override { return "stdio"; }

protected:
    core::errors::Result<std::optional<nlohmann::json>> send_message(
        const nlohmann::json& message, std::chrono::milliseconds timeout) override;

private:
    void reader_loop();
    void handle_line(protocol::LogStream stream, std::string line);

    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    LineSink sink_;

    std::mutex write_mutex_;
    std::atomic_bool connected_{true};
    std::atomic_bool stop_{false};
    std::mutex close_mutex_;
    bool closed_ = false;
    std::thread reader_;
};

}  // namespace toolhub::transport
