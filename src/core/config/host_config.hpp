#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/toolhub_errors.hpp"
#include "core/logging/logger.hpp"

namespace toolhub::core::config {

// A launcher that may be missing on the host and the command used in its
// place. Argument rewriting is part of the shim.
struct CommandFallback {
    std::string primary;
    std::string replacement;
    enum class ArgRewrite {
        ReplaceLeadingRun,  // "run pkg ..." -> "-y pkg ..."
        PrependYes          // "pkg ..."     -> "-y pkg ..."
    } rewrite = ArgRewrite::PrependYes;
};

struct HostConfig {
    std::filesystem::path registry_path;

    std::uint32_t probe_interval_ms = 1000;
    std::uint32_t probe_window_ms = 30000;
    std::uint32_t probe_request_timeout_ms = 2000;
    std::uint32_t stop_grace_ms = 3000;

    std::uint32_t handshake_timeout_ms = 10000;
    std::uint32_t discovery_timeout_ms = 10000;
    std::uint32_t tool_call_timeout_ms = 30000;
    std::uint32_t shutdown_timeout_ms = 3000;

    std::uint32_t reconnect_initial_ms = 1000;
    std::uint32_t reconnect_max_ms = 5000;

    std::size_t log_capacity = 1000;
    std::uint16_t default_port = 3500;

    std::string health_path = "/health";
    std::string rpc_path = "/jsonrpc";
    std::string event_path = "/sse/";

    std::vector<CommandFallback> command_fallbacks = {
        {"uv", "npx", CommandFallback::ArgRewrite::ReplaceLeadingRun},
        {"uvx", "npx", CommandFallback::ArgRewrite::PrependYes}};

    logging::LogLevel log_level = logging::LogLevel::INFO;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
std::optional<std::string> process_env(const std::string& name);

// ~/.toolhub/providers.json, or ./.toolhub/providers.json without HOME.
std::filesystem::path default_registry_path(const EnvLookup& env);

// Defaults overridden by TOOLHUB_* variables. Malformed values are Input errors.
errors::Result<HostConfig> load_host_config(const EnvLookup& env = process_env);

}  // namespace toolhub::core::config
