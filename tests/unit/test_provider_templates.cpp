#include <map>
#include <string>
#include <gtest/gtest.h>
#include "session/provider_templates.hpp"

namespace {

using toolhub::core::errors::get_error;
using toolhub::core::errors::get_value;
using toolhub::core::errors::is_error;
using toolhub::session::builtin_templates;
using toolhub::session::find_template;
using toolhub::session::instantiate;

TEST(ProviderTemplatesTest, ShipsFourTemplates) {
    const auto& templates = builtin_templates();
    ASSERT_EQ(templates.size(), 4u);
    EXPECT_EQ(templates[0].id, "filesystem");
    EXPECT_FALSE(is_error(find_template("memory")));
}

TEST(ProviderTemplatesTest, UnknownTemplateIsRejected) {
    auto found = find_template("weather");
    ASSERT_TRUE(is_error(found));
    EXPECT_EQ(get_error(found).code, "unknown_template");
}

TEST(ProviderTemplatesTest, PathFieldBecomesArgument) {
    auto def = instantiate("filesystem", {{"path", "/srv/data"}});
    ASSERT_FALSE(is_error(def));
    const auto& value = get_value(def);
    EXPECT_EQ(value.command, "npx");
    ASSERT_FALSE(value.args.empty());
    EXPECT_EQ(value.args.back(), "/srv/data");
    EXPECT_TRUE(value.id.empty());
}

TEST(ProviderTemplatesTest, SecretFieldBecomesEnvironment) {
    auto def = instantiate("github", {{"GITHUB_PERSONAL_ACCESS_TOKEN", "ghp_x"}});
    ASSERT_FALSE(is_error(def));
    EXPECT_EQ(get_value(def).env.at("GITHUB_PERSONAL_ACCESS_TOKEN"), "ghp_x");
    EXPECT_EQ(get_value(def).args.size(), 2u);
}

TEST(ProviderTemplatesTest, MissingRequiredValueIsRejected) {
    auto def = instantiate("brave-search", {});
    ASSERT_TRUE(is_error(def));
    EXPECT_EQ(get_error(def).code, "missing_template_value");

    auto empty = instantiate("filesystem", {{"path", ""}});
    ASSERT_TRUE(is_error(empty));
}

TEST(ProviderTemplatesTest, TemplateWithoutFieldsNeedsNoValues) {
    auto def = instantiate("memory", {});
    ASSERT_FALSE(is_error(def));
    EXPECT_EQ(get_value(def).name, "Memory");
}

}  // namespace
