#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolhub_errors.hpp"
#include "protocol/provider_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "transport/request_correlator.hpp"

namespace toolhub::transport {

// Per-call deadlines.
struct RequestTimeouts {
    std::chrono::milliseconds handshake{10000};
    std::chrono::milliseconds discovery{10000};
    std::chrono::milliseconds tool_call{30000};
    std::chrono::milliseconds shutdown{3000};
};

// Receives every raw line a provider emits, tagged with its stream.
using LineSink = std::function<void(protocol::LogStream, const std::string&)>;

// Protocol operations shared by every transport. Subclasses only frame and
// deliver messages; responses come back through dispatch_incoming().
class Transport {
public:
    virtual ~Transport() = default;

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Capability negotiation. Must succeed before list_tools/call_tool.
    core::errors::Result<protocol::ServerInfo> initialize();

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools();

    core::errors::Result<nlohmann::json> call_tool(const std::string& name,
                                                   const nlohmann::json& arguments);

    // shutdown request followed by the exit notification. Does not close().
    core::errors::Result<core::errors::Unit> shutdown();

    virtual bool is_connected() const = 0;

    // Stops background readers and fails outstanding requests. Idempotent.
    virtual void close() = 0;

    virtual std::string kind_name() const = 0;

    bool is_initialized() const;
    protocol::ServerInfo server_info() const;
    nlohmann::json capabilities() const;
    std::size_t pending_requests() const { return correlator_.pending_count(); }

protected:
    explicit Transport(RequestTimeouts timeouts);

    core::errors::Result<nlohmann::json> request(const std::string& method,
                                                 const nlohmann::json& params,
                                                 std::chrono::milliseconds timeout);

    core::errors::Result<core::errors::Unit> notify(const std::string& method,
                                                    const nlohmann::json& params);

    // Delivers one message within `timeout`. A transport that already holds
    // the reply (a synchronous HTTP body) returns it; otherwise std::nullopt.
    virtual core::errors::Result<std::optional<nlohmann::json>> send_message(
        const nlohmann::json& message, std::chrono::milliseconds timeout) = 0;

    // Called by reader threads with every parsed inbound message.
    void dispatch_incoming(const nlohmann::json& message);

    RequestCorrelator correlator_;
    RequestTimeouts timeouts_;

private:
    mutable std::mutex state_mutex_;
    bool initialized_ = false;
    protocol::ServerInfo server_info_;
    nlohmann::json capabilities_ = nlohmann::json::object();
};

}  // namespace toolhub::transport
