#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "backend/backend_pool.hpp"
#include "builtin/onboarding_backend.hpp"
#include "core/errors/proxy_errors.hpp"
#include "fixtures/fake_backend.hpp"
#include "gateway/sparse_gateway.hpp"
#include "registry/tool_registry.hpp"

namespace {

using mcproxy::backend::BackendPool;
using mcproxy::backend::ConnectionOptions;
using mcproxy::builtin::OnboardingBackend;
using mcproxy::core::errors::ErrorCategory;
using mcproxy::core::errors::get_error;
using mcproxy::core::errors::get_value;
using mcproxy::core::errors::is_error;
using mcproxy::gateway::BackendTarget;
using mcproxy::gateway::SparseGateway;
using mcproxy::gateway::VirtualTool;
using mcproxy::registry::ToolRegistry;
using mcproxy::test_support::fake_backend;
using nlohmann::json;
using namespace std::chrono_literals;

json request(int id, const std::string& method, const json& params = json::object()) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

json tool_call(int id, const std::string& name, const json& arguments = json::object()) {
    return request(id, "tools/call", json{{"name", name}, {"arguments", arguments}});
}

std::string text_of(const json& response) {
    return response["result"]["content"][0]["text"].get<std::string>();
}

class SparseGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConnectionOptions options;
        options.request_timeout = 2000ms;
        options.handshake_timeout = 2000ms;
        options.shutdown_grace = 500ms;
        options.reap_interval = 10ms;
        pool = std::make_unique<BackendPool>(options);

        ASSERT_FALSE(is_error(pool->add_builtin(onboarding.descriptor(), onboarding.handler())));
        ASSERT_FALSE(is_error(pool->add_backend(fake_backend("alpha"))));
        pool->broadcast_refresh(registry);
        gateway = std::make_unique<SparseGateway>(*pool, registry);
    }

    void TearDown() override {
        gateway.reset();
        pool.reset();
    }

    json handle_ok(const json& message) {
        auto response = gateway->handle(message);
        EXPECT_FALSE(is_error(response)) << (is_error(response) ? get_error(response).message : "");
        return is_error(response) ? json() : get_value(response);
    }

    OnboardingBackend onboarding;
    ToolRegistry registry;
    std::unique_ptr<BackendPool> pool;
    std::unique_ptr<SparseGateway> gateway;
};

TEST_F(SparseGatewayTest, ToolsListReturnsOnlyTheSparseView) {
    const auto response = handle_ok(request(1, "tools/list"));
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["result"]["tools"], ToolRegistry::sparse_view());
    EXPECT_GT(registry.tool_count(), 3u);
}

TEST_F(SparseGatewayTest, InitializeAndPingAreAnsweredLocally) {
    const auto init = handle_ok(
        request(7, "initialize", {{"protocolVersion", "2024-11-05"}, {"clientInfo", {{"name", "t"}}}}));
    EXPECT_EQ(init["id"], 7);
    EXPECT_EQ(init["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "mcproxy");

    const auto pong = handle_ok(request(8, "ping"));
    EXPECT_EQ(pong["result"], json::object());
}

TEST_F(SparseGatewayTest, DiscoverDefaultsToEveryTool) {
    const auto response = handle_ok(tool_call(2, "mcp_discover"));
    const auto tools = json::parse(text_of(response));
    ASSERT_TRUE(tools.is_array());
    EXPECT_EQ(tools.size(), registry.tool_count());
}

TEST_F(SparseGatewayTest, DiscoverByPath) {
    const auto response =
        handle_ok(tool_call(3, "mcp_discover", {{"jsonpath", "$.tools[?(@.name=='alpha::echo')].description"}}));
    EXPECT_EQ(json::parse(text_of(response)), json::array({"Returns its text argument"}));

    const auto none =
        handle_ok(tool_call(4, "mcp_discover", {{"jsonpath", "$.tools[?(@.server=='nobody')]"}}));
    EXPECT_EQ(text_of(none), "No matches found");
}

TEST_F(SparseGatewayTest, DiscoverReportsQuerySyntaxErrors) {
    auto response = gateway->handle(tool_call(5, "mcp_discover", {{"jsonpath", "$..name"}}));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).category, ErrorCategory::QuerySyntax);
}

TEST_F(SparseGatewayTest, NamespacedCallReachesBackend) {
    const auto response = handle_ok(tool_call(6, "alpha::echo", {{"text", "direct"}}));
    EXPECT_EQ(response["id"], 6);
    EXPECT_EQ(text_of(response), "direct");
}

TEST_F(SparseGatewayTest, UniversalCallMatchesDirectCall) {
    const auto direct = handle_ok(tool_call(10, "alpha::Read", {{"path", "/x"}}));
    const auto relayed = handle_ok(tool_call(
        10, "mcp_call",
        {{"method", "tools/call"}, {"params", {{"name", "alpha::Read"}, {"arguments", {{"path", "/x"}}}}}}));
    EXPECT_EQ(relayed, direct);
    EXPECT_EQ(text_of(relayed), "alpha read /x");
}

TEST_F(SparseGatewayTest, UniversalCallWithServerForwardsAnyMethod) {
    const auto response = handle_ok(tool_call(
        11, "mcp_call", {{"method", "tools/call"}, {"server", "alpha"},
                         {"params", {{"name", "echo"}, {"arguments", {{"text", "via server"}}}}}}));
    EXPECT_EQ(text_of(response), "via server");

    const auto pong =
        handle_ok(tool_call(12, "mcp_call", {{"method", "ping"}, {"server", "alpha"}}));
    EXPECT_EQ(pong["id"], 12);
    EXPECT_EQ(pong["result"], json::object());
}

TEST_F(SparseGatewayTest, UniversalCallRequiresMethod) {
    auto response = gateway->handle(tool_call(13, "mcp_call", {{"params", json::object()}}));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(response).code, "missing_method");
}

TEST_F(SparseGatewayTest, ServerFieldStripsNamespacePrefix) {
    const auto response = handle_ok(request(
        14, "tools/call", {{"name", "alpha::echo"}, {"server", "alpha"}, {"arguments", {{"text", "x"}}}}));
    EXPECT_EQ(text_of(response), "x");
}

TEST_F(SparseGatewayTest, ForwardedToolsListIsFiltered) {
    const auto response = handle_ok(request(15, "tools/list", {{"server", "alpha"}}));
    EXPECT_EQ(response["result"]["tools"], ToolRegistry::sparse_view());
}

TEST_F(SparseGatewayTest, OnboardingIsServedByBuiltin) {
    const auto set = handle_ok(
        tool_call(16, "onboarding", {{"identity", "tester"}, {"instructions", "be brief"}}));
    EXPECT_EQ(text_of(set).rfind("Onboarding set for tester.", 0), 0u);

    const auto get = handle_ok(tool_call(17, "onboarding", {{"identity", "tester"}}));
    EXPECT_EQ(text_of(get), "# Onboarding for tester\n\nbe brief");

    const auto listed = handle_ok(tool_call(18, "onboarding_list"));
    EXPECT_NE(text_of(listed).find("tester"), std::string::npos);
}

TEST_F(SparseGatewayTest, ResolveTargetOrder) {
    auto virtual_target = gateway->resolve_target("mcp_discover", "");
    ASSERT_FALSE(is_error(virtual_target));
    EXPECT_EQ(std::get<VirtualTool>(get_value(virtual_target)), VirtualTool::Discover);

    auto namespaced = gateway->resolve_target("alpha::echo", "");
    ASSERT_FALSE(is_error(namespaced));
    EXPECT_EQ(std::get<BackendTarget>(get_value(namespaced)).backend, "alpha");
    EXPECT_EQ(std::get<BackendTarget>(get_value(namespaced)).tool, "echo");

    auto alias = gateway->resolve_target("onboarding_export", "");
    ASSERT_FALSE(is_error(alias));
    EXPECT_EQ(std::get<BackendTarget>(get_value(alias)).backend, "onboarding");

    auto explicit_server = gateway->resolve_target("mcp_discover", "alpha");
    ASSERT_FALSE(is_error(explicit_server));
    EXPECT_EQ(std::get<BackendTarget>(get_value(explicit_server)).tool, "mcp_discover");
}

TEST_F(SparseGatewayTest, UnknownToolsAndMethodsAreRejected) {
    auto bare = gateway->handle(tool_call(19, "echo"));
    ASSERT_TRUE(is_error(bare));
    EXPECT_EQ(get_error(bare).category, ErrorCategory::UnknownTool);

    auto unknown_backend = gateway->handle(tool_call(20, "nobody::echo"));
    ASSERT_TRUE(is_error(unknown_backend));
    EXPECT_EQ(get_error(unknown_backend).category, ErrorCategory::UnknownTool);

    auto method = gateway->handle(request(21, "resources/list"));
    ASSERT_TRUE(is_error(method));
    EXPECT_EQ(get_error(method).code, "unknown_method");

    auto empty = gateway->handle(request(22, "tools/call", json::object()));
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).category, ErrorCategory::Input);
}

TEST_F(SparseGatewayTest, BackendErrorsAreRelayedUnderCallerId) {
    const auto response = handle_ok(tool_call(23, "alpha::missing"));
    EXPECT_EQ(response["id"], 23);
    EXPECT_EQ(response["error"]["code"], -32602);
}

TEST_F(SparseGatewayTest, NotificationsAndResponsesAreAbsorbed) {
    const auto notification =
        handle_ok(json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    EXPECT_TRUE(notification.is_null());

    const auto reply = handle_ok(json{{"jsonrpc", "2.0"}, {"id", 5}, {"result", json::object()}});
    EXPECT_TRUE(reply.is_null());

    auto invalid = gateway->handle(json{{"jsonrpc", "2.0"}});
    ASSERT_TRUE(is_error(invalid));
    EXPECT_EQ(get_error(invalid).code, "invalid_request");
}

TEST(SparseGatewayFilterTest, OnlyToolArraysAreReplaced) {
    const json untouched = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"content", json::array()}}}};
    EXPECT_EQ(SparseGateway::filter_response(untouched), untouched);

    const json error = {{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", -1}, {"message", "x"}}}};
    EXPECT_EQ(SparseGateway::filter_response(error), error);

    json listing = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", json::array({{{"name", "a"}}})}}}};
    const auto filtered = SparseGateway::filter_response(listing);
    EXPECT_EQ(filtered["result"]["tools"], ToolRegistry::sparse_view());
}

}  // namespace
