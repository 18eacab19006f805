#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolhub_errors.hpp"
#include "protocol/provider_contract.hpp"

namespace toolhub::session {

// Field-level patch. Unset fields keep their stored value.
struct ProviderUpdate {
    std::optional<std::string> id;  // only accepted when equal to the current id
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<protocol::ProviderKind> kind;
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<std::string> url;
    std::optional<std::string> credential;

    // Touches anything a running instance was launched with.
    bool changes_launch_fields() const {
        return kind.has_value() || command.has_value() || args.has_value() || env.has_value() ||
               url.has_value();
    }
};

nlohmann::json definition_to_json(const protocol::ProviderDefinition& definition);
core::errors::Result<protocol::ProviderDefinition> definition_from_json(
    const std::string& id, const nlohmann::json& payload);

// Checks the kind-specific required fields.
core::errors::Result<core::errors::Unit> validate_definition(
    const protocol::ProviderDefinition& definition);

// Flat JSON store: {"version":"1.0.0","providers":{id:{...}}}. The file is
// re-read on every call; each mutation is one locked read-modify-write
// followed by an atomic replace of the file.
class ProviderRegistry {
public:
    using InUseCheck = std::function<bool(const std::string&)>;

    explicit ProviderRegistry(std::filesystem::path path);

    // Installed by the lifecycle controller.
    void set_in_use_check(InUseCheck check);

    // Generates an id when the definition has none. Duplicate ids are refused.
    core::errors::Result<protocol::ProviderDefinition> create(
        protocol::ProviderDefinition definition);

    core::errors::Result<protocol::ProviderDefinition> get(const std::string& id) const;

    core::errors::Result<std::vector<protocol::ProviderDefinition>> list() const;

    core::errors::Result<protocol::ProviderDefinition> update(const std::string& id,
                                                              const ProviderUpdate& patch);

    core::errors::Result<core::errors::Unit> remove(const std::string& id);

    core::errors::Result<core::errors::Unit> record_status(const std::string& id,
                                                           const std::string& status);

    const std::filesystem::path& path() const { return path_; }

private:
    core::errors::Result<nlohmann::json> load_locked() const;
    core::errors::Result<core::errors::Unit> save_locked(const nlohmann::json& document) const;
    bool in_use(const std::string& id) const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    InUseCheck in_use_check_;
};

}  // namespace toolhub::session
