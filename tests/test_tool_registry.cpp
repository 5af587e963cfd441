#include "tools/tool_registry.hpp"
#include "common/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace drive_bridge;
using drive_bridge::test::FakeBackend;
using drive_bridge::test::sample_files;

class ToolRegistryTest : public ::testing::Test {
protected:
    FakeBackend backend_;
    ToolRegistry registry_{backend_};
};

TEST_F(ToolRegistryTest, ListsCanonicalToolsInStableOrder) {
    const auto &tools = registry_.list();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "search");
    EXPECT_EQ(tools[1].name, "fetch");
    EXPECT_EQ(registry_.get_tools_list(), registry_.get_tools_list());
}

TEST_F(ToolRegistryTest, DescriptorsCarrySchemaAndAnnotations) {
    auto listed = registry_.get_tools_list()["tools"];
    ASSERT_EQ(listed.size(), 2u);
    for (const auto &tool: listed) {
        EXPECT_EQ(tool["inputSchema"]["type"], "object");
        EXPECT_EQ(tool["annotations"]["readOnlyHint"], true);
        EXPECT_EQ(tool["annotations"]["openWorldHint"], true);
        EXPECT_FALSE(tool["description"].get<std::string>().empty());
    }
    EXPECT_EQ(listed[1]["inputSchema"]["required"], nlohmann::json::array({"id"}));
}

TEST_F(ToolRegistryTest, AliasesAreCallableButNotListed) {
    EXPECT_TRUE(registry_.has_tool("drive_search"));
    EXPECT_TRUE(registry_.has_tool("drive_fetch"));
    for (const auto &tool: registry_.list()) {
        EXPECT_EQ(tool.name.find("drive_"), std::string::npos);
    }
}

TEST_F(ToolRegistryTest, UnknownToolThrows) {
    EXPECT_THROW(registry_.call_tool("delete_everything", nlohmann::json::object()), UnknownToolError);
}

TEST_F(ToolRegistryTest, SearchAppliesDefaults) {
    backend_.search_result = sample_files(1);
    auto content = registry_.call_tool("search", nlohmann::json::object());

    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0].kind, ContentBlock::Kind::Json);
    EXPECT_EQ(content[0].data, sample_files(1));
    ASSERT_EQ(backend_.searches().size(), 1u);
    EXPECT_EQ(backend_.searches()[0].query, "");
    EXPECT_EQ(backend_.searches()[0].max, 25);
}

TEST_F(ToolRegistryTest, SearchClampsMax) {
    registry_.call_tool("search", {{"q", "a"}, {"max", 1000}});
    registry_.call_tool("search", {{"q", "a"}, {"max", 0}});
    registry_.call_tool("search", {{"q", "a"}, {"max", "7"}});
    auto calls = backend_.searches();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].max, 100);
    EXPECT_EQ(calls[1].max, 1);
    EXPECT_EQ(calls[2].max, 7);
}

TEST_F(ToolRegistryTest, SearchRejectsMalformedArguments) {
    EXPECT_THROW(registry_.call_tool("search", {{"max", "lots"}}), InvalidArgumentsError);
    EXPECT_THROW(registry_.call_tool("search", {{"q", 42}}), InvalidArgumentsError);
}

TEST_F(ToolRegistryTest, AliasDelegatesToSameHandler) {
    backend_.search_result = sample_files(2);
    auto canonical = registry_.call_tool("search", {{"q", "x"}});
    auto alias = registry_.call_tool("drive_search", {{"q", "x"}});
    EXPECT_EQ(content_to_json(canonical), content_to_json(alias));
}

TEST_F(ToolRegistryTest, FetchWithoutIdIsInvalidArgumentsForBothNames) {
    EXPECT_THROW(registry_.call_tool("fetch", nlohmann::json::object()), InvalidArgumentsError);
    EXPECT_THROW(registry_.call_tool("drive_fetch", nlohmann::json::object()), InvalidArgumentsError);
    EXPECT_THROW(registry_.call_tool("fetch", {{"id", ""}}), InvalidArgumentsError);
    EXPECT_THROW(registry_.call_tool("fetch", {{"id", 12}}), InvalidArgumentsError);
    EXPECT_TRUE(backend_.fetches().empty());
}

TEST_F(ToolRegistryTest, FetchInlineTextBecomesTextBlock) {
    backend_.fetch_result = {{"id", "doc"}, {"inline", true}, {"text", "hello\nworld"}};
    auto content = registry_.call_tool("fetch", {{"id", "doc"}});
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0].to_json(), (nlohmann::json{{"type", "text"}, {"text", "hello\nworld"}}));
}

TEST_F(ToolRegistryTest, FetchOtherPayloadBecomesJsonBlock) {
    backend_.fetch_result = {{"id", "sheet"}, {"inline", false}, {"url", "https://example.com/sheet"}};
    auto content = registry_.call_tool("drive_fetch", {{"id", "sheet"}});
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0].to_json()["type"], "json");
    EXPECT_EQ(content[0].to_json()["json"], backend_.fetch_result);
}

TEST_F(ToolRegistryTest, FetchForwardsLineRange) {
    registry_.call_tool("fetch", {{"id", "a"}, {"lines", 40}});
    registry_.call_tool("fetch", {{"id", "b"}, {"lines", "10-20"}});
    registry_.call_tool("fetch", {{"id", "c"}});
    auto calls = backend_.fetches();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].lines, std::optional<std::string>("40"));
    EXPECT_EQ(calls[1].lines, std::optional<std::string>("10-20"));
    EXPECT_FALSE(calls[2].lines.has_value());

    EXPECT_THROW(registry_.call_tool("fetch", {{"id", "d"}, {"lines", nlohmann::json::array()}}),
                 InvalidArgumentsError);
}

TEST_F(ToolRegistryTest, FetchLineCountsKeepTheirValueOrAreRejected) {
    registry_.call_tool("fetch", nlohmann::json::parse(R"({"id":"big","lines":18446744073709551615})"));
    registry_.call_tool("fetch", {{"id", "frac"}, {"lines", 12.9}});
    auto calls = backend_.fetches();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].lines, std::optional<std::string>("18446744073709551615"));
    EXPECT_EQ(calls[1].lines, std::optional<std::string>("12"));

    EXPECT_THROW(registry_.call_tool("fetch", nlohmann::json::parse(R"({"id":"x","lines":1e300})")),
                 InvalidArgumentsError);
    EXPECT_THROW(registry_.call_tool("fetch", nlohmann::json::parse(R"({"id":"x","lines":-1e19})")),
                 InvalidArgumentsError);
    EXPECT_EQ(backend_.fetches().size(), 2u);
}

TEST_F(ToolRegistryTest, BackendFailuresPropagate) {
    backend_.fail_with = [] { throw BackendUnreachable("connection refused"); };
    EXPECT_THROW(registry_.call_tool("search", nlohmann::json::object()), BackendUnreachable);
}
