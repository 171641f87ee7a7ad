#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "registry/tool_registry.hpp"

namespace {

using mcproxy::core::errors::ErrorCategory;
using mcproxy::core::errors::get_error;
using mcproxy::core::errors::get_value;
using mcproxy::core::errors::is_error;
using mcproxy::protocol::ToolDescriptor;
using mcproxy::registry::ToolRegistry;
using nlohmann::json;

std::vector<ToolDescriptor> make_tools(const std::string& backend, int count,
                                       const std::string& prefix = "tool") {
    std::vector<ToolDescriptor> tools;
    for (int i = 0; i < count; ++i) {
        ToolDescriptor tool;
        tool.name = prefix + std::to_string(i);
        tool.backend = backend;
        tool.description = backend + " " + prefix + " " + std::to_string(i);
        tool.input_schema = json{{"type", "object"}};
        tools.push_back(tool);
    }
    return tools;
}

TEST(ToolRegistryTest, NamespacesToolsPerBackend) {
    ToolRegistry registry;
    registry.update_backend_tools("alpha", make_tools("alpha", 2));
    registry.update_backend_tools("beta", make_tools("beta", 3));

    EXPECT_EQ(registry.tool_count(), 5u);
    const auto names = registry.tool_names();
    ASSERT_EQ(names.size(), 5u);
    EXPECT_EQ(names.front(), "alpha::tool0");
    EXPECT_EQ(names.back(), "beta::tool2");

    const auto found = registry.find_tool("beta::tool1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->backend, "beta");
    EXPECT_EQ(found->name, "tool1");
    EXPECT_FALSE(registry.find_tool("gamma::tool0").has_value());
    EXPECT_FALSE(registry.find_tool("tool0").has_value());
}

TEST(ToolRegistryTest, UpdateReplacesOnlyThatBackend) {
    ToolRegistry registry;
    registry.update_backend_tools("alpha", make_tools("alpha", 2));
    registry.update_backend_tools("beta", make_tools("beta", 2));

    registry.update_backend_tools("alpha", make_tools("alpha", 1, "fresh"));

    auto alpha = registry.query("$.tools[?(@.server == 'alpha')].name");
    ASSERT_FALSE(is_error(alpha));
    EXPECT_EQ(get_value(alpha), json::array({"alpha::fresh0"}));

    auto beta = registry.query("$.tools[?(@.server == 'beta')].name");
    ASSERT_FALSE(is_error(beta));
    EXPECT_EQ(get_value(beta), json::array({"beta::tool0", "beta::tool1"}));
}

TEST(ToolRegistryTest, DuplicateToolNamesKeepFirst) {
    ToolRegistry registry;
    auto tools = make_tools("alpha", 1);
    tools.push_back(tools.front());
    tools.back().description = "second copy";
    registry.update_backend_tools("alpha", tools);

    EXPECT_EQ(registry.tool_count(), 1u);
    EXPECT_EQ(registry.find_tool("alpha::tool0")->description, "alpha tool 0");
}

TEST(ToolRegistryTest, RemoveDropsEveryEntryOfBackend) {
    ToolRegistry registry;
    registry.update_backend_tools("alpha", make_tools("alpha", 3));
    registry.set_backend_info("alpha", "first");
    registry.update_backend_tools("beta", make_tools("beta", 1));

    EXPECT_TRUE(registry.remove_backend_tools("alpha"));
    EXPECT_FALSE(registry.remove_backend_tools("alpha"));
    EXPECT_EQ(registry.tool_count(), 1u);
    EXPECT_FALSE(registry.snapshot()["servers"].contains("alpha"));
}

TEST(ToolRegistryTest, SnapshotRendersToolsNamesAndServers) {
    ToolRegistry registry;
    registry.update_backend_tools("alpha", make_tools("alpha", 2));
    registry.set_backend_info("alpha", "Alpha backend");
    registry.set_backend_info("idle", "No tools yet");

    const auto tree = registry.snapshot();
    ASSERT_EQ(tree["tools"].size(), 2u);
    EXPECT_EQ(tree["tools"][0]["name"], "alpha::tool0");
    EXPECT_EQ(tree["tools"][0]["tool"], "tool0");
    EXPECT_EQ(tree["tools"][0]["server"], "alpha");
    EXPECT_EQ(tree["tools"][0]["inputSchema"]["type"], "object");
    EXPECT_EQ(tree["tool_names"], json::array({"alpha::tool0", "alpha::tool1"}));
    EXPECT_EQ(tree["servers"]["alpha"]["description"], "Alpha backend");
    EXPECT_EQ(tree["servers"]["alpha"]["tool_count"], 2);
    EXPECT_EQ(tree["servers"]["idle"]["tool_count"], 0);
}

TEST(ToolRegistryTest, QueryIsRepeatableAndEmptyWhenNothingMatches) {
    ToolRegistry registry;
    registry.update_backend_tools("alpha", make_tools("alpha", 4));

    auto first = registry.query("$.tools[*].name");
    auto second = registry.query("$.tools[*].name");
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first), get_value(second));

    auto none = registry.query("$.tools[?(@.server == 'nobody')]");
    ASSERT_FALSE(is_error(none));
    EXPECT_TRUE(get_value(none).is_array());
    EXPECT_TRUE(get_value(none).empty());
}

TEST(ToolRegistryTest, QueryReportsSyntaxErrors) {
    ToolRegistry registry;
    auto result = registry.query("$..name");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::QuerySyntax);
}

TEST(ToolRegistryTest, AliasesResolveOnlyForAliasingBackends) {
    ToolRegistry registry;
    registry.update_backend_tools("onboarding", make_tools("onboarding", 1, "onboarding_list"),
                                  true);
    registry.update_backend_tools("plain", make_tools("plain", 1, "hidden"));

    EXPECT_EQ(registry.resolve_alias("onboarding_list0").value_or(""),
              "onboarding::onboarding_list0");
    EXPECT_FALSE(registry.resolve_alias("hidden0").has_value());
}

TEST(ToolRegistryTest, SparseViewIsFixedRegardlessOfCatalogSize) {
    ToolRegistry registry;
    const std::string empty_view = ToolRegistry::sparse_view().dump();

    registry.update_backend_tools("one", make_tools("one", 1));
    EXPECT_EQ(ToolRegistry::sparse_view().dump(), empty_view);

    for (int i = 0; i < 50; ++i) {
        const std::string backend = "backend" + std::to_string(i);
        registry.update_backend_tools(backend, make_tools(backend, 5));
    }
    EXPECT_EQ(registry.tool_count(), 251u);
    EXPECT_EQ(ToolRegistry::sparse_view().dump(), empty_view);

    const auto& view = ToolRegistry::sparse_view();
    ASSERT_EQ(view.size(), 3u);
    EXPECT_EQ(view[0]["name"], "mcp_discover");
    EXPECT_EQ(view[1]["name"], "mcp_call");
    EXPECT_EQ(view[2]["name"], "onboarding");
}

TEST(ToolRegistryTest, ReadersNeverSeePartialUpdates) {
    ToolRegistry registry;
    registry.update_backend_tools("alpha", make_tools("alpha", 10, "old"));

    std::atomic_bool done{false};
    std::thread writer([&]() {
        for (int i = 0; i < 200; ++i) {
            registry.update_backend_tools("alpha", make_tools("alpha", 10, i % 2 ? "old" : "new"));
        }
        done = true;
    });

    int torn = 0;
    while (!done.load()) {
        const auto tree = registry.snapshot();
        const auto& tools = tree["tools"];
        if (tools.size() != 10u) {
            ++torn;
            continue;
        }
        const std::string first = tools[0]["tool"].get<std::string>().substr(0, 3);
        for (const auto& tool : tools) {
            if (tool["tool"].get<std::string>().substr(0, 3) != first) {
                ++torn;
                break;
            }
        }
    }
    writer.join();
    EXPECT_EQ(torn, 0);
}

}  // namespace
