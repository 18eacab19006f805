#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/host_config.hpp"

namespace {

using toolhub::core::config::EnvLookup;
using toolhub::core::config::HostConfig;
using toolhub::core::config::load_host_config;
using toolhub::core::errors::get_error;
using toolhub::core::errors::get_value;
using toolhub::core::errors::is_error;

EnvLookup env_from(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

TEST(HostConfigTest, DefaultsWithoutOverrides) {
    auto loaded = load_host_config(env_from({{"HOME", "/home/tester"}}));
    ASSERT_FALSE(is_error(loaded));
    const HostConfig& config = get_value(loaded);
    EXPECT_EQ(config.registry_path.string(), "/home/tester/.toolhub/providers.json");
    EXPECT_EQ(config.probe_interval_ms, 1000u);
    EXPECT_EQ(config.probe_window_ms, 30000u);
    EXPECT_EQ(config.default_port, 3500);
    EXPECT_EQ(config.health_path, "/health");
    EXPECT_EQ(config.rpc_path, "/jsonrpc");
    EXPECT_EQ(config.event_path, "/sse/");
    ASSERT_EQ(config.command_fallbacks.size(), 2u);
    EXPECT_EQ(config.command_fallbacks[0].primary, "uv");
    EXPECT_EQ(config.command_fallbacks[1].primary, "uvx");
}

TEST(HostConfigTest, FallsBackToWorkingDirectoryWithoutHome) {
    auto loaded = load_host_config(env_from({}));
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).registry_path.string(), ".toolhub/providers.json");
}

TEST(HostConfigTest, ReadsOverrides) {
    auto loaded = load_host_config(env_from({{"TOOLHUB_REGISTRY", "/tmp/reg.json"},
                                             {"TOOLHUB_PROBE_INTERVAL_MS", "50"},
                                             {"TOOLHUB_STOP_GRACE_MS", "0"},
                                             {"TOOLHUB_DEFAULT_PORT", "8080"},
                                             {"TOOLHUB_LOG_LEVEL", "debug"}}));
    ASSERT_FALSE(is_error(loaded));
    const HostConfig& config = get_value(loaded);
    EXPECT_EQ(config.registry_path.string(), "/tmp/reg.json");
    EXPECT_EQ(config.probe_interval_ms, 50u);
    EXPECT_EQ(config.stop_grace_ms, 0u);
    EXPECT_EQ(config.default_port, 8080);
    EXPECT_EQ(config.log_level, toolhub::core::logging::LogLevel::DEBUG);
}

TEST(HostConfigTest, RejectsMalformedNumbers) {
    auto loaded = load_host_config(env_from({{"TOOLHUB_PROBE_WINDOW_MS", "12abc"}}));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_integer");
}

TEST(HostConfigTest, RejectsOutOfBoundsPort) {
    auto loaded = load_host_config(env_from({{"TOOLHUB_DEFAULT_PORT", "70000"}}));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "bounds_error");
}

TEST(HostConfigTest, RejectsIntervalLongerThanWindow) {
    auto loaded = load_host_config(env_from({{"TOOLHUB_PROBE_INTERVAL_MS", "5000"},
                                             {"TOOLHUB_PROBE_WINDOW_MS", "1000"}}));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "conflicting_settings");
}

TEST(HostConfigTest, RejectsUnknownLogLevel) {
    auto loaded = load_host_config(env_from({{"TOOLHUB_LOG_LEVEL", "loud"}}));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_log_level");
}

}  // namespace
