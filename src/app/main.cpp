#include <csignal>
#include <cstdint>
#include <ctime>
#include <pthread.h>
#include <signal.h>
#include <iostream>
#include <iterator>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/host_config.hpp"
#include "core/errors/toolhub_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/lifecycle_controller.hpp"
#include "session/provider_registry.hpp"
#include "session/provider_templates.hpp"
#include "tools/tool_bridge.hpp"
#include "tools/tool_call_extractor.hpp"

namespace {

using nlohmann::json;
using toolhub::app::cli::CliRequest;
using toolhub::app::cli::Command;
using toolhub::core::errors::ToolhubError;
using toolhub::runtime::LifecycleController;

void report(const std::string& what, const ToolhubError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

std::string command_name(const Command command) {
    switch (command) {
        case Command::List:      return "list";
        case Command::Templates: return "templates";
        case Command::Install:   return "install";
        case Command::Uninstall: return "uninstall";
        case Command::Tools:     return "tools";
        case Command::Call:      return "call";
        case Command::Serve:     return "serve";
        case Command::Extract:   return "extract";
        default: return "toolhub";
    }
}

json server_info_to_json(const toolhub::protocol::ServerInfo& info) {
    return json{{"name", info.name},
                {"version", info.version},
                {"protocolVersion", info.protocol_version}};
}

int run_list(LifecycleController& controller) {
    auto listed = controller.list();
    if (toolhub::core::errors::is_error(listed)) {
        report("Failed to list providers", toolhub::core::errors::get_error(listed));
        return 1;
    }

    json out = json::array();
    for (const auto& listing : toolhub::core::errors::get_value(listed)) {
        const auto& def = listing.definition;
        json item{{"id", def.id},
                  {"name", def.name},
                  {"description", def.description},
                  {"kind", toolhub::protocol::to_string(def.kind)},
                  {"state", toolhub::protocol::to_string(listing.state)},
                  {"recorded_status", def.status}};
        if (def.kind == toolhub::protocol::ProviderKind::Process) {
            item["command"] = def.command;
            item["args"] = def.args;
        } else {
            item["url"] = def.url.value_or("");
        }
        if (listing.pid) {
            item["pid"] = *listing.pid;
        }
        out.push_back(std::move(item));
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int run_templates() {
    json out = json::array();
    for (const auto& tmpl : toolhub::session::builtin_templates()) {
        json fields = json::array();
        for (const auto& field : tmpl.fields) {
            fields.push_back(json{{"name", field.name},
                                  {"description", field.description},
                                  {"required", field.required},
                                  {"env", field.is_env}});
        }
        out.push_back(json{{"id", tmpl.id},
                           {"name", tmpl.name},
                           {"description", tmpl.description},
                           {"kind", toolhub::protocol::to_string(tmpl.kind)},
                           {"command", tmpl.command},
                           {"args", tmpl.args},
                           {"fields", fields}});
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int run_install(LifecycleController& controller, const CliRequest& req) {
    toolhub::protocol::ProviderDefinition definition = req.definition;
    if (req.template_id) {
        auto instantiated = toolhub::session::instantiate(*req.template_id, req.template_values);
        if (toolhub::core::errors::is_error(instantiated)) {
            report("Invalid template settings", toolhub::core::errors::get_error(instantiated));
            return 2;
        }
        definition = toolhub::core::errors::get_value(instantiated);
        definition.id = req.definition.id;
        if (!req.definition.name.empty()) definition.name = req.definition.name;
        if (!req.definition.description.empty()) definition.description = req.definition.description;
        if (req.definition.credential) definition.credential = req.definition.credential;
        for (const auto& item : req.definition.env) {
            definition.env[item.first] = item.second;
        }
    }

    auto created = controller.install(std::move(definition));
    if (toolhub::core::errors::is_error(created)) {
        report("Failed to install provider", toolhub::core::errors::get_error(created));
        return 1;
    }
    const auto& def = toolhub::core::errors::get_value(created);
    std::cout << json{{"id", def.id}, {"name", def.name}}.dump(2) << std::endl;
    return 0;
}

int run_uninstall(LifecycleController& controller, const std::string& provider_id) {
    auto removed = controller.uninstall(provider_id);
    if (toolhub::core::errors::is_error(removed)) {
        report("Failed to uninstall provider", toolhub::core::errors::get_error(removed));
        return 1;
    }
    LOG_INFO("Uninstalled " + provider_id);
    return 0;
}

int run_tools(toolhub::tools::ToolBridge& bridge, const std::string& provider_id) {
    auto discovered = bridge.discover_tools(provider_id, true);
    if (toolhub::core::errors::is_error(discovered)) {
        report("Tool discovery failed", toolhub::core::errors::get_error(discovered));
        return 1;
    }
    json out = json::array();
    for (const auto& function : toolhub::core::errors::get_value(discovered)) {
        out.push_back(toolhub::protocol::to_json(function));
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int run_call(LifecycleController& controller, toolhub::tools::ToolBridge& bridge,
             const CliRequest& req) {
    auto started = controller.start(req.provider_id);
    if (toolhub::core::errors::is_error(started)) {
        report("Failed to start provider", toolhub::core::errors::get_error(started));
        return 1;
    }

    const auto result = bridge.execute_tool(req.provider_id, req.tool_name, req.arguments);
    json out{{"success", result.success}, {"duration_ms", result.duration_ms}};
    if (result.success) {
        out["payload"] = result.payload;
    } else {
        out["error"] = json{{"code", result.error_code}, {"message", result.error_message}};
        if (result.remote_code) {
            out["error"]["remote_code"] = *result.remote_code;
        }
    }
    std::cout << out.dump(2) << std::endl;
    return result.success ? 0 : 1;
}

int run_serve(LifecycleController& controller, const std::string& provider_id,
              const sigset_t& signals) {
    auto started = controller.start(provider_id);
    if (toolhub::core::errors::is_error(started)) {
        report("Failed to start provider", toolhub::core::errors::get_error(started));
        return 1;
    }
    const auto& outcome = toolhub::core::errors::get_value(started);
    json summary{{"id", provider_id},
                 {"url", outcome.url},
                 {"server", server_info_to_json(outcome.server_info)}};
    if (outcome.pid) summary["pid"] = *outcome.pid;
    if (!outcome.launch_note.empty()) summary["note"] = outcome.launch_note;
    std::cout << summary.dump(2) << std::endl;

    std::uint64_t last_sequence = 0;
    timespec tick{0, 500000000};
    while (true) {
        auto entries = controller.logs(provider_id, 0);
        if (!toolhub::core::errors::is_error(entries)) {
            for (const auto& entry : toolhub::core::errors::get_value(entries)) {
                if (entry.sequence <= last_sequence) {
                    continue;
                }
                std::cout << "[" << toolhub::protocol::to_string(entry.stream) << "] "
                          << entry.text << std::endl;
                last_sequence = entry.sequence;
            }
        }

        auto current = controller.status(provider_id);
        if (toolhub::core::errors::is_error(current)) {
            report("Status check failed", toolhub::core::errors::get_error(current));
            return 1;
        }
        const auto state = toolhub::core::errors::get_value(current).state;
        if (state == toolhub::protocol::LifecycleState::Stopped ||
            state == toolhub::protocol::LifecycleState::Error) {
            LOG_ERROR("Provider " + provider_id + " stopped unexpectedly");
            return 1;
        }

        const int sig = sigtimedwait(&signals, nullptr, &tick);
        if (sig == SIGINT || sig == SIGTERM) {
            LOG_INFO("Received signal " + std::to_string(sig) + ", stopping " + provider_id);
            break;
        }
    }

    auto stopped = controller.stop(provider_id);
    if (toolhub::core::errors::is_error(stopped)) {
        report("Failed to stop provider", toolhub::core::errors::get_error(stopped));
        return 1;
    }
    return 0;
}

int run_extract() {
    const std::string text((std::istreambuf_iterator<char>(std::cin)),
                           std::istreambuf_iterator<char>());
    const auto call = toolhub::tools::extract_tool_call(text);
    if (!call) {
        LOG_WARN("No tool call found in input");
        return 1;
    }
    std::cout << toolhub::protocol::to_json(*call).dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = toolhub::app::cli::parse_and_validate(argc, argv);
    if (toolhub::core::errors::is_error(parsed)) {
        const auto& err = toolhub::core::errors::get_error(parsed);
        if (err.code == "help_requested") {
            std::cout << err.hint;
            return 0;
        }
        report("Input error", err);
        return 2;
    }
    const auto& req = toolhub::core::errors::get_value(parsed);
    toolhub::core::logging::Logger::get().set_context(
        req.provider_id.empty() ? command_name(req.command)
                                : command_name(req.command) + " " + req.provider_id);

    // 2. Host configuration from TOOLHUB_* variables, then flags
    auto loaded = toolhub::core::config::load_host_config();
    if (toolhub::core::errors::is_error(loaded)) {
        report("Configuration error", toolhub::core::errors::get_error(loaded));
        return 3;
    }
    auto config = toolhub::core::errors::get_value(loaded);
    if (req.registry_path) {
        config.registry_path = *req.registry_path;
    }
    auto level = config.log_level;
    if (req.log_level) {
        static_cast<void>(toolhub::core::logging::Logger::parse_level(*req.log_level, level));
    }
    toolhub::core::logging::Logger::get().set_min_level(level);

    if (req.command == Command::Templates) {
        return run_templates();
    }
    if (req.command == Command::Extract) {
        return run_extract();
    }

    // serve waits for these itself; block them before any thread exists.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (req.command == Command::Serve) {
        static_cast<void>(pthread_sigmask(SIG_BLOCK, &signals, nullptr));
    }

    LOG_DEBUG("Registry: " + config.registry_path.string());
    toolhub::session::ProviderRegistry registry(config.registry_path);
    LifecycleController controller(registry, config);
    toolhub::tools::ToolBridge bridge(controller);

    switch (req.command) {
        case Command::List:
            return run_list(controller);
        case Command::Install:
            return run_install(controller, req);
        case Command::Uninstall:
            return run_uninstall(controller, req.provider_id);
        case Command::Tools:
            return run_tools(bridge, req.provider_id);
        case Command::Call:
            return run_call(controller, bridge, req);
        case Command::Serve:
            return run_serve(controller, req.provider_id, signals);
        default:
            return 2;
    }
}
