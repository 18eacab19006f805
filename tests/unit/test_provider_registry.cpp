#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/id_gen.hpp"
#include "core/errors/toolhub_errors.hpp"
#include "session/provider_registry.hpp"

namespace {

using nlohmann::json;
using toolhub::core::errors::ErrorCategory;
using toolhub::core::errors::get_error;
using toolhub::core::errors::get_value;
using toolhub::core::errors::is_error;
using toolhub::protocol::ProviderDefinition;
using toolhub::protocol::ProviderKind;
using toolhub::session::ProviderRegistry;
using toolhub::session::ProviderUpdate;

class ProviderRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("toolhub-registry-" + toolhub::core::config::random_hex(8));
        path_ = dir_ / "nested" / "providers.json";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static ProviderDefinition process_definition(const std::string& id = "") {
        ProviderDefinition def;
        def.id = id;
        def.name = "Echo";
        def.command = "echo-server";
        def.args = {"--port", "4000"};
        def.env = {{"TOKEN", "abc"}};
        return def;
    }

    json read_file() const {
        std::ifstream in(path_);
        return json::parse(in);
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

TEST_F(ProviderRegistryTest, MissingFileIsEmpty) {
    ProviderRegistry registry(path_);
    auto listed = registry.list();
    ASSERT_FALSE(is_error(listed));
    EXPECT_TRUE(get_value(listed).empty());
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(ProviderRegistryTest, CreateGeneratesIdAndPersists) {
    ProviderRegistry registry(path_);
    auto created = registry.create(process_definition());
    ASSERT_FALSE(is_error(created));
    const auto& def = get_value(created);
    EXPECT_EQ(def.id.rfind("prov-", 0), 0u);
    EXPECT_EQ(def.status, "stopped");

    const json document = read_file();
    EXPECT_EQ(document["version"], "1.0.0");
    ASSERT_TRUE(document["providers"].contains(def.id));
    EXPECT_EQ(document["providers"][def.id]["command"], "echo-server");
    EXPECT_EQ(document["providers"][def.id]["kind"], "process");
    EXPECT_FALSE(std::filesystem::exists(path_.string() + ".tmp"));

    // A second registry over the same file sees the entry.
    ProviderRegistry reopened(path_);
    auto fetched = reopened.get(def.id);
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched).env.at("TOKEN"), "abc");
    EXPECT_EQ(get_value(fetched).args.size(), 2u);
}

TEST_F(ProviderRegistryTest, RejectsDuplicateIds) {
    ProviderRegistry registry(path_);
    ASSERT_FALSE(is_error(registry.create(process_definition("echo"))));
    auto again = registry.create(process_definition("echo"));
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "duplicate_provider");
}

TEST_F(ProviderRegistryTest, RejectsInvalidDefinitions) {
    ProviderRegistry registry(path_);

    ProviderDefinition no_command = process_definition();
    no_command.command.clear();
    auto created = registry.create(no_command);
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).category, ErrorCategory::Configuration);

    ProviderDefinition no_url;
    no_url.name = "Remote";
    no_url.kind = ProviderKind::Network;
    EXPECT_TRUE(is_error(registry.create(no_url)));

    ProviderDefinition tls = no_url;
    tls.url = "https://example.com";
    EXPECT_TRUE(is_error(registry.create(tls)));
}

TEST_F(ProviderRegistryTest, UnknownIdIsNotFound) {
    ProviderRegistry registry(path_);
    auto fetched = registry.get("nope");
    ASSERT_TRUE(is_error(fetched));
    EXPECT_EQ(get_error(fetched).code, "provider_not_found");

    auto removed = registry.remove("nope");
    ASSERT_TRUE(is_error(removed));
    EXPECT_EQ(get_error(removed).code, "provider_not_found");
}

TEST_F(ProviderRegistryTest, UpdatePatchesFieldsButNotId) {
    ProviderRegistry registry(path_);
    ASSERT_FALSE(is_error(registry.create(process_definition("echo"))));

    ProviderUpdate patch;
    patch.description = "updated";
    patch.args = std::vector<std::string>{"--verbose"};
    auto updated = registry.update("echo", patch);
    ASSERT_FALSE(is_error(updated));
    EXPECT_EQ(get_value(updated).description, "updated");
    EXPECT_EQ(get_value(updated).command, "echo-server");
    ASSERT_EQ(get_value(updated).args.size(), 1u);

    ProviderUpdate rename;
    rename.id = "other";
    auto refused = registry.update("echo", rename);
    ASSERT_TRUE(is_error(refused));
    EXPECT_EQ(get_error(refused).code, "immutable_id");
}

TEST_F(ProviderRegistryTest, InUseProviderKeepsLaunchFields) {
    ProviderRegistry registry(path_);
    ASSERT_FALSE(is_error(registry.create(process_definition("echo"))));
    registry.set_in_use_check([](const std::string& id) { return id == "echo"; });

    ProviderUpdate launch;
    launch.command = "other-server";
    auto refused = registry.update("echo", launch);
    ASSERT_TRUE(is_error(refused));
    EXPECT_EQ(get_error(refused).code, "provider_in_use");

    ProviderUpdate cosmetic;
    cosmetic.name = "Renamed";
    EXPECT_FALSE(is_error(registry.update("echo", cosmetic)));

    auto removed = registry.remove("echo");
    ASSERT_TRUE(is_error(removed));
    EXPECT_EQ(get_error(removed).code, "provider_in_use");

    registry.set_in_use_check(nullptr);
    EXPECT_FALSE(is_error(registry.remove("echo")));
    EXPECT_TRUE(is_error(registry.get("echo")));
}

TEST_F(ProviderRegistryTest, RecordsStatus) {
    ProviderRegistry registry(path_);
    ASSERT_FALSE(is_error(registry.create(process_definition("echo"))));
    ASSERT_FALSE(is_error(registry.record_status("echo", "running")));
    auto fetched = registry.get("echo");
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched).status, "running");
}

TEST_F(ProviderRegistryTest, CorruptFileIsReported) {
    std::filesystem::create_directories(path_.parent_path());
    {
        std::ofstream out(path_);
        out << "{ not json";
    }
    ProviderRegistry registry(path_);
    auto listed = registry.list();
    ASSERT_TRUE(is_error(listed));
    EXPECT_EQ(get_error(listed).code, "registry_corrupt");
}

TEST_F(ProviderRegistryTest, ReadsLegacyTypeField) {
    std::filesystem::create_directories(path_.parent_path());
    {
        std::ofstream out(path_);
        out << R"({"providers":{"remote":{"name":"Remote","type":"sse","url":"http://localhost:3600"},
                   "broken":{"name":"Broken","type":"carrier-pigeon"}}})";
    }
    ProviderRegistry registry(path_);
    auto listed = registry.list();
    ASSERT_FALSE(is_error(listed));
    ASSERT_EQ(get_value(listed).size(), 1u);
    EXPECT_EQ(get_value(listed)[0].kind, ProviderKind::Network);
    EXPECT_EQ(get_value(listed)[0].url.value_or(""), "http://localhost:3600");
}

}  // namespace
