#include "core/config/host_config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace toolhub::core::config {

using errors::ErrorCategory;
using errors::Result;
using errors::ToolhubError;

namespace {

template <typename T>
std::optional<ToolhubError> read_number(const EnvLookup& env, const std::string& name,
                                        const T min_value, const T max_value, T& out) {
    const auto raw = env(name);
    if (!raw.has_value() || raw->empty()) {
        return std::nullopt;
    }

    std::uint64_t parsed = 0;
    const char* begin = raw->data();
    const char* end = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end) {
        return ToolhubError{ErrorCategory::Input, "Invalid number for " + name + ": " + *raw,
                            "invalid_integer", "Provide a non-negative integer."};
    }
    if (parsed < static_cast<std::uint64_t>(min_value) ||
        parsed > static_cast<std::uint64_t>(max_value)) {
        return ToolhubError{ErrorCategory::Input, name + " out of bounds: " + *raw,
                            "bounds_error",
                            "Must be between " + std::to_string(min_value) + " and " +
                                std::to_string(max_value) + "."};
    }
    out = static_cast<T>(parsed);
    return std::nullopt;
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::filesystem::path default_registry_path(const EnvLookup& env) {
    const auto home = env("HOME");
    if (home.has_value() && !home->empty()) {
        return std::filesystem::path(*home) / ".toolhub" / "providers.json";
    }
    return std::filesystem::path(".toolhub") / "providers.json";
}

Result<HostConfig> load_host_config(const EnvLookup& env) {
    HostConfig config;

    const auto registry = env("TOOLHUB_REGISTRY");
    config.registry_path = (registry.has_value() && !registry->empty())
                               ? std::filesystem::path(*registry)
                               : default_registry_path(env);

    constexpr std::uint32_t kMaxMs = 10 * 60 * 1000;
    std::optional<ToolhubError> err;
    if ((err = read_number<std::uint32_t>(env, "TOOLHUB_PROBE_INTERVAL_MS", 10, kMaxMs,
                                          config.probe_interval_ms))) {
        return *err;
    }
    if ((err = read_number<std::uint32_t>(env, "TOOLHUB_PROBE_WINDOW_MS", 10, kMaxMs,
                                          config.probe_window_ms))) {
        return *err;
    }
    if ((err = read_number<std::uint32_t>(env, "TOOLHUB_STOP_GRACE_MS", 0, kMaxMs,
                                          config.stop_grace_ms))) {
        return *err;
    }
    if ((err = read_number<std::uint32_t>(env, "TOOLHUB_HANDSHAKE_TIMEOUT_MS", 1, kMaxMs,
                                          config.handshake_timeout_ms))) {
        return *err;
    }
    if ((err = read_number<std::uint32_t>(env, "TOOLHUB_DISCOVERY_TIMEOUT_MS", 1, kMaxMs,
                                          config.discovery_timeout_ms))) {
        return *err;
    }
    if ((err = read_number<std::uint32_t>(env, "TOOLHUB_TOOL_CALL_TIMEOUT_MS", 1, kMaxMs,
                                          config.tool_call_timeout_ms))) {
        return *err;
    }
    if ((err = read_number<std::size_t>(env, "TOOLHUB_LOG_CAPACITY", 1, 1000000,
                                        config.log_capacity))) {
        return *err;
    }
    if ((err = read_number<std::uint16_t>(env, "TOOLHUB_DEFAULT_PORT", 1,
                                          std::numeric_limits<std::uint16_t>::max(),
                                          config.default_port))) {
        return *err;
    }

    if (config.probe_interval_ms > config.probe_window_ms) {
        return ToolhubError{ErrorCategory::Input,
                            "TOOLHUB_PROBE_INTERVAL_MS exceeds TOOLHUB_PROBE_WINDOW_MS",
                            "conflicting_settings"};
    }

    const auto level = env("TOOLHUB_LOG_LEVEL");
    if (level.has_value() && !level->empty() &&
        !logging::Logger::parse_level(*level, config.log_level)) {
        return ToolhubError{ErrorCategory::Input, "Unknown log level: " + *level,
                            "invalid_log_level", "Use debug, info, warn or error."};
    }

    return config;
}

}  // namespace toolhub::core::config
