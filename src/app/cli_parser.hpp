#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/toolhub_errors.hpp"
#include "protocol/provider_contract.hpp"

namespace toolhub::app::cli {

    enum class Command {
        List,
        Templates,
        Install,
        Uninstall,
        Tools,
        Call,
        Serve,
        Extract
    };

    struct CliRequest {
        Command command = Command::List;
        std::optional<std::filesystem::path> registry_path;
        std::optional<std::string> log_level;

        std::string provider_id;  // uninstall, tools, call, serve

        // install
        protocol::ProviderDefinition definition;
        std::optional<std::string> template_id;
        std::map<std::string, std::string> template_values;

        // call
        std::string tool_name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    toolhub::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
