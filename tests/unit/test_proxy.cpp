#include <chrono>
#include <csignal>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <signal.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/proxy_config.hpp"
#include "core/errors/proxy_errors.hpp"
#include "fixtures/fake_backend.hpp"
#include "proxy/proxy.hpp"
#include "registry/tool_registry.hpp"

namespace {

using mcproxy::core::config::ProxyConfig;
using mcproxy::core::errors::ErrorCategory;
using mcproxy::core::errors::get_error;
using mcproxy::core::errors::get_value;
using mcproxy::core::errors::is_error;
using mcproxy::proxy::Proxy;
using mcproxy::registry::ToolRegistry;
using mcproxy::test_support::fake_backend;
using nlohmann::json;
using namespace std::chrono_literals;

ProxyConfig test_config(std::vector<mcproxy::protocol::BackendDescriptor> backends,
                        bool builtins = false) {
    ProxyConfig config;
    config.backends = std::move(backends);
    config.enable_builtin_servers = builtins;
    config.request_timeout_ms = 3000;
    config.handshake_timeout_ms = 2000;
    config.shutdown_grace_ms = 500;
    return config;
}

json tool_call(int id, const std::string& name, const json& arguments = json::object()) {
    return json{{"jsonrpc", "2.0"},
                {"id", id},
                {"method", "tools/call"},
                {"params", {{"name", name}, {"arguments", arguments}}}};
}

std::string text_of(const json& response) {
    return response["result"]["content"][0]["text"].get<std::string>();
}

TEST(ProxyTest, AggregatesCatalogButListsSparseTools) {
    Proxy proxy(test_config({fake_backend("alpha"), fake_backend("beta")}));
    const auto outcomes = proxy.start();
    ASSERT_EQ(outcomes.size(), 2u);

    auto names = proxy.discover("$.tools[*].name");
    ASSERT_FALSE(is_error(names));
    EXPECT_EQ(get_value(names).size(), 10u);

    auto listed = proxy.call(json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed)["result"]["tools"].size(), 3u);
    EXPECT_EQ(get_value(listed)["result"]["tools"], ToolRegistry::sparse_view());

    auto discovered = proxy.call(tool_call(2, "mcp_discover", {{"jsonpath", "$.tools[*].name"}}));
    ASSERT_FALSE(is_error(discovered));
    EXPECT_EQ(json::parse(text_of(get_value(discovered))).size(), 10u);
}

TEST(ProxyTest, UniversalCallEqualsDirectCall) {
    Proxy proxy(test_config({fake_backend("backendA")}));
    proxy.start();

    auto direct = proxy.call(tool_call(5, "backendA::Read", {{"path", "/x"}}));
    auto relayed = proxy.call(tool_call(
        5, "mcp_call",
        {{"method", "tools/call"},
         {"params", {{"name", "backendA::Read"}, {"arguments", {{"path", "/x"}}}}}}));
    ASSERT_FALSE(is_error(direct));
    ASSERT_FALSE(is_error(relayed));
    EXPECT_EQ(get_value(relayed), get_value(direct));
}

TEST(ProxyTest, KilledBackendFailsOnlyItsOwnCall) {
    Proxy proxy(test_config({fake_backend("backendA"), fake_backend("backendB")}));
    proxy.start();

    auto slow = std::async(std::launch::async, [&proxy]() {
        return proxy.call(tool_call(1, "backendB::delay", {{"ms", 5000}}));
    });
    auto fast = std::async(std::launch::async, [&proxy]() {
        return proxy.call(tool_call(2, "backendA::delay", {{"ms", 200}}));
    });

    std::this_thread::sleep_for(100ms);
    auto connection = get_value(proxy.pool().find("backendB"));
    const auto pid = connection->pid();
    ASSERT_TRUE(pid.has_value());
    ASSERT_EQ(::kill(*pid, SIGKILL), 0);

    ASSERT_EQ(slow.wait_for(3s), std::future_status::ready);
    const auto failed = slow.get();
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).category, ErrorCategory::BackendUnavailable);

    const auto succeeded = fast.get();
    ASSERT_FALSE(is_error(succeeded));
    EXPECT_EQ(text_of(get_value(succeeded)), "backendA slept 200");

    auto catalog = proxy.discover("$.tools[?(@.server == 'backendA')]");
    ASSERT_FALSE(is_error(catalog));
    EXPECT_EQ(get_value(catalog).size(), 5u);
}

TEST(ProxyTest, EscapedNewlineSurvivesRelay) {
    Proxy proxy(test_config({fake_backend("alpha")}));
    proxy.start();

    auto response = proxy.call(tool_call(3, "alpha::noise"));
    ASSERT_FALSE(is_error(response));
    EXPECT_EQ(text_of(get_value(response)), "line one\nline two");
}

TEST(ProxyTest, RuntimeAddKeepsExistingEntries) {
    auto config = test_config({fake_backend("alpha")});
    config.refresh_on_add = false;
    Proxy proxy(config);
    proxy.start();

    auto before = proxy.discover("$.tools[?(@.server == 'alpha')].name");
    ASSERT_FALSE(is_error(before));

    ASSERT_FALSE(is_error(proxy.add_backend(fake_backend("gamma"))));
    EXPECT_EQ(proxy.registry().tool_count(), 5u);

    proxy.refresh();
    EXPECT_EQ(proxy.registry().tool_count(), 10u);

    auto after = proxy.discover("$.tools[?(@.server == 'alpha')].name");
    ASSERT_FALSE(is_error(after));
    EXPECT_EQ(get_value(after), get_value(before));
}

TEST(ProxyTest, RefreshOnAddAndRemove) {
    Proxy proxy(test_config({}));
    proxy.start();
    EXPECT_EQ(proxy.registry().tool_count(), 0u);

    ASSERT_FALSE(is_error(proxy.add_backend(fake_backend("gamma"))));
    EXPECT_EQ(proxy.registry().tool_count(), 5u);

    ASSERT_FALSE(is_error(proxy.remove_backend("gamma")));
    EXPECT_EQ(proxy.registry().tool_count(), 0u);

    auto removed_again = proxy.remove_backend("gamma");
    ASSERT_TRUE(is_error(removed_again));
    EXPECT_EQ(get_error(removed_again).category, ErrorCategory::UnknownTool);
}

TEST(ProxyTest, DiscoverWithNoBackends) {
    Proxy proxy(test_config({}));
    proxy.start();

    auto result = proxy.discover("$.tools[*]");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).empty());

    auto response = proxy.call(tool_call(1, "mcp_discover"));
    ASSERT_FALSE(is_error(response));
    EXPECT_EQ(text_of(get_value(response)), "No matches found");
}

TEST(ProxyTest, FailedBackendIsSkippedAtStart) {
    Proxy proxy(test_config({fake_backend("alpha"), fake_backend("broken", {"--reject-initialize"})}));
    proxy.start();
    EXPECT_EQ(proxy.pool().size(), 1u);
    EXPECT_EQ(proxy.registry().tool_count(), 5u);
}

TEST(ProxyTest, BuiltinOnboardingIsAvailable) {
    Proxy proxy(test_config({}, true));
    proxy.start();
    EXPECT_TRUE(proxy.pool().is_builtin("onboarding"));

    auto set = proxy.call(tool_call(1, "onboarding", {{"identity", "me"}, {"instructions", "hi"}}));
    ASSERT_FALSE(is_error(set));
    auto get = proxy.call(tool_call(2, "onboarding", {{"identity", "me"}}));
    ASSERT_FALSE(is_error(get));
    EXPECT_EQ(text_of(get_value(get)), "# Onboarding for me\n\nhi");
}

TEST(ProxyTest, NotificationsReachSink) {
    std::mutex mutex;
    std::vector<std::string> backends;
    Proxy proxy(test_config({fake_backend("alpha")}));
    proxy.set_notification_sink([&](const std::string& backend, const json&) {
        std::lock_guard<std::mutex> lock(mutex);
        backends.push_back(backend);
    });
    proxy.start();

    ASSERT_FALSE(is_error(proxy.call(tool_call(1, "alpha::noise"))));
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(backends.size(), 1u);
    EXPECT_EQ(backends[0], "alpha");
}

TEST(ProxyTest, ShutdownFailsPendingAndLaterCalls) {
    Proxy proxy(test_config({fake_backend("alpha")}));
    proxy.start();

    auto pending = std::async(std::launch::async, [&proxy]() {
        return proxy.call(tool_call(1, "alpha::delay", {{"ms", 5000}}));
    });
    std::this_thread::sleep_for(100ms);

    proxy.shutdown();
    EXPECT_TRUE(proxy.is_shut_down());

    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    const auto outcome = pending.get();
    ASSERT_TRUE(is_error(outcome));
    EXPECT_EQ(get_error(outcome).category, ErrorCategory::Shutdown);

    auto later = proxy.call(tool_call(2, "alpha::echo", {{"text", "x"}}));
    ASSERT_TRUE(is_error(later));
    EXPECT_EQ(get_error(later).category, ErrorCategory::Shutdown);

    auto added = proxy.add_backend(fake_backend("beta"));
    ASSERT_TRUE(is_error(added));
    EXPECT_EQ(get_error(added).category, ErrorCategory::Shutdown);

    proxy.shutdown();
}

TEST(ProxyTest, ConcurrentCallsAcrossBackendsAreNeverCrossDelivered) {
    Proxy proxy(test_config({fake_backend("alpha"), fake_backend("beta"), fake_backend("gamma")}));
    proxy.start();

    const std::vector<std::string> backends = {"alpha", "beta", "gamma"};
    std::vector<std::future<bool>> calls;
    for (int i = 0; i < 30; ++i) {
        const std::string backend = backends[static_cast<std::size_t>(i) % backends.size()];
        calls.push_back(std::async(std::launch::async, [&proxy, backend, i]() {
            const std::string payload = backend + "-" + std::to_string(i);
            auto response = proxy.call(tool_call(i, backend + "::echo", {{"text", payload}}));
            return !is_error(response) && get_value(response)["id"] == i &&
                   text_of(get_value(response)) == payload;
        }));
    }
    for (auto& call : calls) {
        EXPECT_TRUE(call.get());
    }
}

}  // namespace
