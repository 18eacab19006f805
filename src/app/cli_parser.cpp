#include "cli_parser.hpp"
#include "core/logging/logger.hpp"
#include <optional>
#include <vector>

namespace toolhub::app::cli {

    using namespace toolhub::core::errors;

    namespace {

        // Raw install flags before validation
        struct RawInstallOptions {
            std::optional<std::string> id;
            std::optional<std::string> name;
            std::optional<std::string> kind;
            std::optional<std::string> command;
            std::vector<std::string> args;
            std::vector<std::string> env;
            std::optional<std::string> url;
            std::optional<std::string> description;
            std::optional<std::string> credential;
            std::optional<std::string> template_id;
            std::vector<std::string> sets;
        };

        std::optional<Command> parse_command(const std::string& text) {
            if (text == "list") return Command::List;
            if (text == "templates") return Command::Templates;
            if (text == "install") return Command::Install;
            if (text == "uninstall") return Command::Uninstall;
            if (text == "tools") return Command::Tools;
            if (text == "call") return Command::Call;
            if (text == "serve") return Command::Serve;
            if (text == "extract") return Command::Extract;
            return std::nullopt;
        }

        ToolhubError missing_value(const std::string& flag) {
            return ToolhubError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        // "K=V" with a non-empty key
        bool split_pair(const std::string& text, std::string& key, std::string& value) {
            const auto eq = text.find('=');
            if (eq == std::string::npos || eq == 0) {
                return false;
            }
            key = text.substr(0, eq);
            value = text.substr(eq + 1);
            return true;
        }

        Result<CliRequest> validate_install(CliRequest req, const RawInstallOptions& raw) {
            for (const auto& item : raw.sets) {
                std::string key;
                std::string value;
                if (!split_pair(item, key, value)) {
                    return ToolhubError{ErrorCategory::Input, "Expected KEY=VALUE for --set, got: " + item, "invalid_pair"};
                }
                req.template_values[key] = value;
            }

            if (raw.template_id) {
                if (raw.command || raw.kind || raw.url || !raw.args.empty()) {
                    return ToolhubError{ErrorCategory::Input, "Cannot combine --template with --command, --kind, --url or --arg", "conflicting_flags"};
                }
                req.template_id = raw.template_id;
            } else {
                if (!raw.name) {
                    return ToolhubError{ErrorCategory::Input, "install requires --name or --template", "missing_required_flag"};
                }
                if (!req.template_values.empty()) {
                    return ToolhubError{ErrorCategory::Input, "--set is only valid with --template", "conflicting_flags"};
                }
            }

            auto& def = req.definition;
            if (raw.id) def.id = *raw.id;
            if (raw.name) def.name = *raw.name;
            if (raw.description) def.description = *raw.description;
            if (raw.command) def.command = *raw.command;
            def.args = raw.args;
            if (raw.url) def.url = *raw.url;
            if (raw.credential) def.credential = *raw.credential;

            if (raw.kind) {
                const auto kind = protocol::parse_provider_kind(*raw.kind);
                if (!kind) {
                    return ToolhubError{ErrorCategory::Input, "Unknown provider kind: " + *raw.kind, "invalid_kind", "Use 'process' or 'network'."};
                }
                def.kind = *kind;
            }

            for (const auto& item : raw.env) {
                std::string key;
                std::string value;
                if (!split_pair(item, key, value)) {
                    return ToolhubError{ErrorCategory::Input, "Expected KEY=VALUE for --env, got: " + item, "invalid_pair"};
                }
                def.env[key] = value;
            }

            if (!raw.template_id) {
                if (def.kind == protocol::ProviderKind::Process && def.command.empty()) {
                    return ToolhubError{ErrorCategory::Input, "A process provider needs --command", "missing_required_flag"};
                }
                if (def.kind == protocol::ProviderKind::Network && !def.url) {
                    return ToolhubError{ErrorCategory::Input, "A network provider needs --url", "missing_required_flag"};
                }
            }
            return req;
        }

    } // namespace

    std::string usage() {
        return "Usage: toolhub [--registry PATH] [--log-level debug|info|warn|error] <command>\n"
               "  list\n"
               "  templates\n"
               "  install --name N [--kind process|network] [--command C] [--arg A]...\n"
               "          [--env K=V]... [--url U] [--description D] [--credential T] [--id ID]\n"
               "  install --template T [--set K=V]... [--name N] [--id ID]\n"
               "  uninstall <id>\n"
               "  tools <id>\n"
               "  call <id> <tool> [--args JSON]\n"
               "  serve <id>\n"
               "  extract            (reads model output on stdin)\n";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        CliRequest req;
        std::optional<Command> command;
        std::vector<std::string> positionals;
        RawInstallOptions install;
        std::optional<std::string> call_args;

        // 1. Parser Phase: global flags anywhere, command flags after the command
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            auto take = [&](std::string& out) -> bool {
                if (i + 1 >= args.size()) return false;
                out = args[++i];
                return true;
            };
            std::string value;

            if (arg == "--registry") {
                if (!take(value)) return missing_value(arg);
                req.registry_path = std::filesystem::path(value);
            } else if (arg == "--log-level") {
                if (!take(value)) return missing_value(arg);
                req.log_level = value;
            } else if (arg == "--help" || arg == "-h") {
                return ToolhubError{ErrorCategory::Input, "Help requested.", "help_requested", usage()};
            } else if (!command) {
                if (arg.rfind("--", 0) == 0) {
                    return ToolhubError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
                }
                command = parse_command(arg);
                if (!command) {
                    return ToolhubError{ErrorCategory::Input, "Unknown command: " + arg, "unknown_command", usage()};
                }
            } else if (*command == Command::Install && arg.rfind("--", 0) == 0) {
                if (arg == "--id") { if (!take(value)) return missing_value(arg); install.id = value; }
                else if (arg == "--name") { if (!take(value)) return missing_value(arg); install.name = value; }
                else if (arg == "--kind") { if (!take(value)) return missing_value(arg); install.kind = value; }
                else if (arg == "--command") { if (!take(value)) return missing_value(arg); install.command = value; }
                else if (arg == "--arg") { if (!take(value)) return missing_value(arg); install.args.push_back(value); }
                else if (arg == "--env") { if (!take(value)) return missing_value(arg); install.env.push_back(value); }
                else if (arg == "--url") { if (!take(value)) return missing_value(arg); install.url = value; }
                else if (arg == "--description") { if (!take(value)) return missing_value(arg); install.description = value; }
                else if (arg == "--credential") { if (!take(value)) return missing_value(arg); install.credential = value; }
                else if (arg == "--template") { if (!take(value)) return missing_value(arg); install.template_id = value; }
                else if (arg == "--set") { if (!take(value)) return missing_value(arg); install.sets.push_back(value); }
                else return ToolhubError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
            } else if (*command == Command::Call && arg == "--args") {
                if (!take(value)) return missing_value(arg);
                call_args = value;
            } else if (arg.rfind("--", 0) == 0) {
                return ToolhubError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
            } else {
                positionals.push_back(arg);
            }
        }

        if (!command) {
            return ToolhubError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }
        req.command = *command;

        // 2. Validator Phase
        if (req.log_level) {
            toolhub::core::logging::LogLevel level;
            if (!toolhub::core::logging::Logger::parse_level(*req.log_level, level)) {
                return ToolhubError{ErrorCategory::Input, "Invalid log level: " + *req.log_level, "invalid_log_level", "Use debug, info, warn or error."};
            }
        }

        size_t expected_positionals = 0;
        switch (req.command) {
            case Command::Uninstall:
            case Command::Tools:
            case Command::Serve:
                expected_positionals = 1;
                break;
            case Command::Call:
                expected_positionals = 2;
                break;
            default:
                break;
        }
        if (positionals.size() < expected_positionals) {
            return ToolhubError{ErrorCategory::Input, "Missing provider id or tool name.", "missing_argument", usage()};
        }
        if (positionals.size() > expected_positionals) {
            return ToolhubError{ErrorCategory::Input, "Unexpected argument: " + positionals[expected_positionals], "unknown_argument"};
        }
        if (expected_positionals >= 1) req.provider_id = positionals[0];
        if (expected_positionals == 2) req.tool_name = positionals[1];

        if (call_args) {
            nlohmann::json parsed = nlohmann::json::parse(*call_args, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return ToolhubError{ErrorCategory::Input, "--args must be a JSON object", "invalid_json"};
            }
            req.arguments = std::move(parsed);
        }

        if (req.command == Command::Install) {
            return validate_install(std::move(req), install);
        }
        return req;
    }

} // namespace toolhub::app::cli
