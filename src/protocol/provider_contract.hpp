#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolhub::protocol {

enum class ProviderKind {
    Process,  // spawned child, stdio transport
    Network   // already reachable, event-stream transport
};

enum class LifecycleState {
    Stopped,
    Starting,
    Running,
    Unhealthy,
    Error
};

struct ProviderDefinition {
    std::string id;
    std::string name;
    std::string description;
    ProviderKind kind = ProviderKind::Process;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> url;
    std::optional<std::string> credential;
    std::string status = "stopped";  // last state recorded by the controller
};

enum class LogStream {
    Out,
    Err
};

struct LogEntry {
    std::uint64_t sequence = 0;  // increasing per ring, survives eviction
    std::chrono::system_clock::time_point timestamp;
    LogStream stream = LogStream::Out;
    std::string text;
};

// Remote identity recorded by the handshake.
struct ServerInfo {
    std::string name = "Unknown Server";
    std::string version = "Unknown Version";
    std::string protocol_version = "Unknown";
};

inline std::string to_string(const ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Process:
            return "process";
        case ProviderKind::Network:
            return "network";
        default:
            return "unknown";
    }
}

inline std::optional<ProviderKind> parse_provider_kind(const std::string& text) {
    // "stdio"/"sse" are the transport names older definitions used.
    if (text == "process" || text == "stdio") {
        return ProviderKind::Process;
    }
    if (text == "network" || text == "sse") {
        return ProviderKind::Network;
    }
    return std::nullopt;
}

inline std::string to_string(const LifecycleState state) {
    switch (state) {
        case LifecycleState::Stopped:
            return "stopped";
        case LifecycleState::Starting:
            return "starting";
        case LifecycleState::Running:
            return "running";
        case LifecycleState::Unhealthy:
            return "unhealthy";
        case LifecycleState::Error:
            return "error";
        default:
            return "unknown";
    }
}

inline std::string to_string(const LogStream stream) {
    return stream == LogStream::Out ? "out" : "err";
}

}  // namespace toolhub::protocol
