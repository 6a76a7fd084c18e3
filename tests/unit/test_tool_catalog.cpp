#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/worker_errors.hpp"
#include "tools/tool_catalog.hpp"

namespace {

using nlohmann::json;
using toolbridge::core::errors::get_error;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;
using toolbridge::tools::ToolCatalog;

ToolCatalog sample_catalog() {
    const json document = {
        {"tools",
         {{{"name", "github_get_repo"},
           {"category", "Repository Management"},
           {"description", "Get repository details"},
           {"parameters", {{"owner", "string"}, {"repo", "string"}}}},
          {{"name", "github_list_issues"},
           {"category", "Issues"},
           {"description", "List issues in a repository"}},
          {{"name", "github_create_issue"},
           {"category", "Issues"},
           {"description", "Open a new issue"}},
          {{"name", "workspace_grep"}, {"description", "Search files in the workspace"}}}}};
    auto catalog = ToolCatalog::from_json(document);
    EXPECT_FALSE(is_error(catalog));
    return get_value(catalog);
}

TEST(ToolCatalogTest, ParsesDefinitionsAndDefaultsCategory) {
    const auto catalog = sample_catalog();
    ASSERT_EQ(catalog.size(), 4u);
    const auto grep = catalog.find("workspace_grep");
    ASSERT_TRUE(grep.has_value());
    EXPECT_EQ(grep->category, "Other");
    EXPECT_FALSE(catalog.find("github_delete_repo").has_value());
}

TEST(ToolCatalogTest, SearchMatchesNameDescriptionAndCategoryCaseInsensitively) {
    const auto catalog = sample_catalog();
    EXPECT_EQ(catalog.search("ISSUE").size(), 2u);
    EXPECT_EQ(catalog.search("repository").size(), 2u);
    EXPECT_EQ(catalog.search("workspace").size(), 1u);
    EXPECT_TRUE(catalog.search("nothing-like-this").empty());
}

TEST(ToolCatalogTest, FiltersByExactCategory) {
    const auto catalog = sample_catalog();
    const auto issues = catalog.in_category("Issues");
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].name, "github_list_issues");
    EXPECT_TRUE(catalog.in_category("issues").empty());
}

TEST(ToolCatalogTest, SummaryGroupsByCategory) {
    const json summary = sample_catalog().summary();
    EXPECT_EQ(summary["totalTools"], 4);
    EXPECT_EQ(summary["categories"],
              json::array({"Issues", "Other", "Repository Management"}));
    EXPECT_EQ(summary["byCategory"]["Issues"].size(), 2u);
    EXPECT_EQ(summary["toolsByCategory"], summary["tools"]);
}

TEST(ToolCatalogTest, RejectsDuplicateAndNamelessEntries) {
    auto duplicate = ToolCatalog::from_json(json::array({json{{"name", "a"}}, json{{"name", "a"}}}));
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "invalid_catalog");

    auto nameless = ToolCatalog::from_json(json::array({json{{"description", "x"}}}));
    ASSERT_TRUE(is_error(nameless));

    auto not_array = ToolCatalog::from_json(json{{"tools", "none"}});
    ASSERT_TRUE(is_error(not_array));
}

TEST(ToolCatalogTest, BuildsFromProviderListing) {
    const json listing = json::array(
        {json{{"name", "github_get_user"},
              {"description", "Fetch a user"},
              {"inputSchema",
               {{"type", "object"}, {"properties", {{"username", {{"type", "string"}}}}}}}},
         json{{"description", "entry without a name is skipped"}}});
    const auto catalog = ToolCatalog::from_listing(listing);
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.tools()[0].parameters["username"]["type"], "string");
    EXPECT_TRUE(ToolCatalog::from_listing(json("garbage")).empty());
}

TEST(ToolCatalogTest, LoadReadsFileAndReportsErrors) {
    const auto path = std::filesystem::temp_directory_path() / "toolbridge_catalog_test.json";
    {
        std::ofstream out(path);
        out << R"([{"name": "github_get_repo", "category": "Repository Management"}])";
    }
    auto loaded = ToolCatalog::load(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).size(), 1u);

    {
        std::ofstream out(path);
        out << "{not json";
    }
    auto broken = ToolCatalog::load(path);
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "invalid_catalog");
    std::filesystem::remove(path);

    auto missing = ToolCatalog::load(path);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "catalog_file_unreadable");
}

}  // namespace
