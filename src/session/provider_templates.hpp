#pragma once

#include <map>
#include <string>
#include <vector>
#include "core/errors/toolhub_errors.hpp"
#include "protocol/provider_contract.hpp"

namespace toolhub::session {

struct TemplateField {
    std::string name;
    std::string description;
    bool required = true;
    bool is_env = false;  // value goes to env; otherwise it is a path argument
};

struct ProviderTemplate {
    std::string id;
    std::string name;
    std::string description;
    protocol::ProviderKind kind = protocol::ProviderKind::Process;
    std::string command;
    std::vector<std::string> args;
    std::vector<TemplateField> fields;
};

// Built-in templates: filesystem, brave-search, github, memory.
const std::vector<ProviderTemplate>& builtin_templates();

core::errors::Result<ProviderTemplate> find_template(const std::string& template_id);

// Fills a definition from a template. Unknown templates and missing
// required values are Configuration errors; the id is left empty.
core::errors::Result<protocol::ProviderDefinition> instantiate(
    const std::string& template_id, const std::map<std::string, std::string>& values);

}  // namespace toolhub::session
