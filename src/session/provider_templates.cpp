#include "session/provider_templates.hpp"

namespace toolhub::session {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;

const std::vector<ProviderTemplate>& builtin_templates() {
    static const std::vector<ProviderTemplate> templates = {
        {"filesystem",
         "Filesystem",
         "Access and manipulate files in a directory",
         protocol::ProviderKind::Process,
         "npx",
         {"-y", "@modelcontextprotocol/server-filesystem@latest"},
         {{"path", "Path to the directory to expose", true, false}}},
        {"brave-search",
         "Brave Search",
         "Search the web using Brave Search API",
         protocol::ProviderKind::Process,
         "npx",
         {"-y", "@modelcontextprotocol/server-brave-search@latest"},
         {{"BRAVE_API_KEY", "Brave Search API Key", true, true}}},
        {"github",
         "GitHub",
         "Access and manage GitHub repositories",
         protocol::ProviderKind::Process,
         "npx",
         {"-y", "@modelcontextprotocol/server-github@latest"},
         {{"GITHUB_PERSONAL_ACCESS_TOKEN", "GitHub Personal Access Token", true, true}}},
        {"memory",
         "Memory",
         "Knowledge graph-based persistent memory",
         protocol::ProviderKind::Process,
         "npx",
         {"-y", "@modelcontextprotocol/server-memory@latest"},
         {}},
    };
    return templates;
}

core::errors::Result<ProviderTemplate> find_template(const std::string& template_id) {
    for (const auto& candidate : builtin_templates()) {
        if (candidate.id == template_id) {
            return candidate;
        }
    }
    return ToolhubError{ErrorCategory::Configuration, "Unknown template: " + template_id,
                        "unknown_template"};
}

core::errors::Result<protocol::ProviderDefinition> instantiate(
    const std::string& template_id, const std::map<std::string, std::string>& values) {
    auto found = find_template(template_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const ProviderTemplate& tmpl = core::errors::get_value(found);

    protocol::ProviderDefinition definition;
    definition.name = tmpl.name;
    definition.description = tmpl.description;
    definition.kind = tmpl.kind;
    definition.command = tmpl.command;
    definition.args = tmpl.args;

    for (const auto& field : tmpl.fields) {
        const auto it = values.find(field.name);
        if (it == values.end() || it->second.empty()) {
            if (field.required) {
                return ToolhubError{ErrorCategory::Configuration,
                                    "Template " + template_id + " requires '" + field.name + "'",
                                    "missing_template_value", field.description};
            }
            continue;
        }
        if (field.is_env) {
            definition.env[field.name] = it->second;
        } else {
            definition.args.push_back(it->second);
        }
    }
    return definition;
}

}  // namespace toolhub::session
