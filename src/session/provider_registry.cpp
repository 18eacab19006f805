#include "session/provider_registry.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/config/id_gen.hpp"
#include "core/logging/logger.hpp"
#include "transport/http_client.hpp"

namespace toolhub::session {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;
using core::errors::Unit;
using nlohmann::json;
using protocol::ProviderDefinition;
using protocol::ProviderKind;

namespace {

constexpr const char* kRegistryVersion = "1.0.0";

json empty_document() {
    return json{{"version", kRegistryVersion}, {"providers", json::object()}};
}

ToolhubError not_found(const std::string& id) {
    return ToolhubError{ErrorCategory::Configuration, "Provider not found: " + id,
                        "provider_not_found"};
}

ToolhubError in_use_error(const std::string& id, const std::string& action) {
    return ToolhubError{ErrorCategory::Configuration,
                        "Cannot " + action + " provider " + id + " while it is running",
                        "provider_in_use", "Stop the provider first."};
}

}  // namespace

json definition_to_json(const ProviderDefinition& definition) {
    json payload;
    payload["name"] = definition.name;
    payload["description"] = definition.description;
    payload["kind"] = protocol::to_string(definition.kind);
    payload["command"] = definition.command;
    payload["args"] = definition.args;
    payload["env"] = definition.env;
    if (definition.url.has_value()) {
        payload["url"] = *definition.url;
    }
    if (definition.credential.has_value()) {
        payload["credential"] = *definition.credential;
    }
    payload["status"] = definition.status;
    return payload;
}

core::errors::Result<ProviderDefinition> definition_from_json(const std::string& id,
                                                              const json& payload) {
    if (!payload.is_object()) {
        return ToolhubError{ErrorCategory::Configuration,
                            "Provider entry " + id + " is not an object",
                            "invalid_definition"};
    }

    try {
        ProviderDefinition definition;
        definition.id = id;
        definition.name = payload.value("name", "");
        definition.description = payload.value("description", "");

        // Older files call the field "type".
        const std::string kind_text =
            payload.contains("kind") ? payload.at("kind").get<std::string>()
                                     : payload.value("type", std::string("process"));
        const auto kind = protocol::parse_provider_kind(kind_text);
        if (!kind.has_value()) {
            return ToolhubError{ErrorCategory::Configuration,
                                "Provider " + id + " has unknown kind '" + kind_text + "'",
                                "invalid_definition"};
        }
        definition.kind = *kind;

        definition.command = payload.value("command", "");
        if (payload.contains("args")) {
            definition.args = payload.at("args").get<std::vector<std::string>>();
        }
        if (payload.contains("env")) {
            definition.env = payload.at("env").get<std::map<std::string, std::string>>();
        }
        if (payload.contains("url") && payload.at("url").is_string()) {
            definition.url = payload.at("url").get<std::string>();
        }
        if (payload.contains("credential") && payload.at("credential").is_string()) {
            definition.credential = payload.at("credential").get<std::string>();
        }
        definition.status = payload.value("status", "stopped");
        return definition;
    } catch (const json::exception& e) {
        return ToolhubError{ErrorCategory::Configuration,
                            "Provider " + id + " is malformed: " + e.what(),
                            "invalid_definition"};
    }
}

core::errors::Result<Unit> validate_definition(const ProviderDefinition& definition) {
    if (definition.name.empty()) {
        return ToolhubError{ErrorCategory::Configuration, "Provider name cannot be empty",
                            "invalid_definition"};
    }
    if (definition.kind == ProviderKind::Process && definition.command.empty()) {
        return ToolhubError{ErrorCategory::Configuration,
                            "Process provider " + definition.name + " needs a command",
                            "invalid_definition"};
    }
    if (definition.kind == ProviderKind::Network) {
        if (!definition.url.has_value() || definition.url->empty()) {
            return ToolhubError{ErrorCategory::Configuration,
                                "Network provider " + definition.name + " needs a url",
                                "invalid_definition"};
        }
        auto url = transport::http_client::parse_url(*definition.url);
        if (core::errors::is_error(url)) {
            return core::errors::get_error(url);
        }
    }
    return Unit{};
}

ProviderRegistry::ProviderRegistry(std::filesystem::path path) : path_(std::move(path)) {}

void ProviderRegistry::set_in_use_check(InUseCheck check) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_use_check_ = std::move(check);
}

bool ProviderRegistry::in_use(const std::string& id) const {
    InUseCheck check;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check = in_use_check_;
    }
    return check && check(id);
}

core::errors::Result<json> ProviderRegistry::load_locked() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec) || ec) {
        return empty_document();
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        return ToolhubError{ErrorCategory::Configuration,
                            "Unable to open provider registry: " + path_.string(),
                            "registry_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return ToolhubError{ErrorCategory::Configuration,
                            "Provider registry is not valid JSON: " + path_.string(),
                            "registry_corrupt",
                            "Fix or delete the file to start with an empty registry."};
    }
    if (!document.contains("providers") || !document["providers"].is_object()) {
        document["providers"] = json::object();
    }
    if (!document.contains("version")) {
        document["version"] = kRegistryVersion;
    }
    return document;
}

core::errors::Result<Unit> ProviderRegistry::save_locked(const json& document) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return ToolhubError{ErrorCategory::Configuration,
                                "Unable to create registry directory: " +
                                    path_.parent_path().string(),
                                "registry_write_failed"};
        }
    }

    auto temp_path = path_;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return ToolhubError{ErrorCategory::Configuration,
                                "Unable to open registry for writing: " + temp_path.string(),
                                "registry_write_failed"};
        }
        out << document.dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            return ToolhubError{ErrorCategory::Configuration,
                                "Unable to write provider registry: " + temp_path.string(),
                                "registry_write_failed"};
        }
    }

    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return ToolhubError{ErrorCategory::Configuration,
                            "Unable to replace provider registry: " + path_.string(),
                            "registry_write_failed"};
    }
    return Unit{};
}

core::errors::Result<ProviderDefinition> ProviderRegistry::create(ProviderDefinition definition) {
    auto valid = validate_definition(definition);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    json document = std::move(core::errors::get_value(loaded));
    json& providers = document["providers"];

    if (definition.id.empty()) {
        constexpr int kMaxAttempts = 16;
        for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
            const std::string candidate = core::config::generate_provider_id();
            if (!providers.contains(candidate)) {
                definition.id = candidate;
                break;
            }
        }
        if (definition.id.empty()) {
            return ToolhubError{ErrorCategory::Internal, "Unable to allocate a provider id",
                                "provider_id_generation_failed"};
        }
    } else if (providers.contains(definition.id)) {
        return ToolhubError{ErrorCategory::Configuration,
                            "Provider already exists: " + definition.id, "duplicate_provider"};
    }

    definition.status = "stopped";
    providers[definition.id] = definition_to_json(definition);
    auto saved = save_locked(document);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    LOG_INFO("registry: added provider " + definition.id + " (" + definition.name + ")");
    return definition;
}

core::errors::Result<ProviderDefinition> ProviderRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const json& providers = core::errors::get_value(loaded).at("providers");
    const auto it = providers.find(id);
    if (it == providers.end()) {
        return not_found(id);
    }
    return definition_from_json(id, *it);
}

core::errors::Result<std::vector<ProviderDefinition>> ProviderRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }

    std::vector<ProviderDefinition> definitions;
    const json& providers = core::errors::get_value(loaded).at("providers");
    for (auto it = providers.begin(); it != providers.end(); ++it) {
        auto definition = definition_from_json(it.key(), it.value());
        if (core::errors::is_error(definition)) {
            LOG_WARN("registry: skipping entry: " + core::errors::get_error(definition).message);
            continue;
        }
        definitions.push_back(std::move(core::errors::get_value(definition)));
    }
    return definitions;
}

core::errors::Result<ProviderDefinition> ProviderRegistry::update(const std::string& id,
                                                                  const ProviderUpdate& patch) {
    if (patch.id.has_value() && *patch.id != id) {
        return ToolhubError{ErrorCategory::Configuration,
                            "Provider id cannot be changed (" + id + " -> " + *patch.id + ")",
                            "immutable_id"};
    }
    // Checked before taking the registry lock; the check locks the controller.
    // LifecycleController::update() holds the provider's operation lock around
    // this call, which keeps a start from racing the write.
    if (patch.changes_launch_fields() && in_use(id)) {
        return in_use_error(id, "change the launch settings of");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    json document = std::move(core::errors::get_value(loaded));
    json& providers = document["providers"];
    const auto it = providers.find(id);
    if (it == providers.end()) {
        return not_found(id);
    }

    auto current = definition_from_json(id, *it);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    ProviderDefinition definition = std::move(core::errors::get_value(current));
    if (patch.name) definition.name = *patch.name;
    if (patch.description) definition.description = *patch.description;
    if (patch.kind) definition.kind = *patch.kind;
    if (patch.command) definition.command = *patch.command;
    if (patch.args) definition.args = *patch.args;
    if (patch.env) definition.env = *patch.env;
    if (patch.url) definition.url = *patch.url;
    if (patch.credential) definition.credential = *patch.credential;

    auto valid = validate_definition(definition);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    providers[id] = definition_to_json(definition);
    auto saved = save_locked(document);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    LOG_INFO("registry: updated provider " + id);
    return definition;
}

core::errors::Result<Unit> ProviderRegistry::remove(const std::string& id) {
    if (in_use(id)) {
        return in_use_error(id, "remove");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    json document = std::move(core::errors::get_value(loaded));
    if (document["providers"].erase(id) == 0) {
        return not_found(id);
    }
    auto saved = save_locked(document);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    LOG_INFO("registry: removed provider " + id);
    return Unit{};
}

core::errors::Result<Unit> ProviderRegistry::record_status(const std::string& id,
                                                           const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load_locked();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    json document = std::move(core::errors::get_value(loaded));
    json& providers = document["providers"];
    const auto it = providers.find(id);
    if (it == providers.end()) {
        return not_found(id);
    }
    if (it->value("status", "") == status) {
        return Unit{};
    }
    (*it)["status"] = status;
    return save_locked(document);
}

}  // namespace toolhub::session
