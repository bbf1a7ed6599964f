#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "tools/tool_registry.hpp"

namespace {

using nlohmann::json;
using toolbridge::core::errors::BridgeError;
using toolbridge::core::errors::ErrorCategory;
using toolbridge::core::errors::get_error;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;
using toolbridge::core::errors::Result;
using toolbridge::protocol::ToolCallResult;
using toolbridge::protocol::ToolDescriptor;
using toolbridge::tools::ToolRegistry;

ToolDescriptor echo_descriptor(const std::string& name = "echo") {
    ToolDescriptor descriptor;
    descriptor.name = name;
    descriptor.description = "Echo the message back";
    descriptor.parameters = json{{"type", "object"},
                                 {"properties", {{"message", {{"type", "string"}}}}},
                                 {"required", json::array({"message"})}};
    descriptor.synonyms = {{"message", {"msg", "text"}}};
    return descriptor;
}

Result<json> echo(const json& arguments) {
    return json{{"echo", arguments.at("message")}};
}

TEST(ToolRegistryTest, InvokesRegisteredTool) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor(), echo);

    auto outcome = registry.invoke("echo", json{{"msg", "hi"}});
    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.result["echo"], "hi");
    EXPECT_FALSE(outcome.error.has_value());

    auto stats = registry.stats("echo");
    ASSERT_FALSE(is_error(stats));
    EXPECT_EQ(get_value(stats).call_count, 1u);
    EXPECT_EQ(get_value(stats).success_count, 1u);
    EXPECT_EQ(get_value(stats).error_count, 0u);
    EXPECT_TRUE(get_value(stats).last_used.has_value());
}

TEST(ToolRegistryTest, UnknownToolListsAvailableTools) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor("alpha"), echo);
    registry.register_tool(echo_descriptor("beta"), echo);

    auto outcome = registry.invoke("gamma", json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(outcome.result.is_null());
    EXPECT_EQ(outcome.error_code, "unknown_tool");
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value(), "Unknown tool: gamma. Available tools: alpha, beta");
}

TEST(ToolRegistryTest, ValidationFailureCountsAsError) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor(), echo);

    auto outcome = registry.invoke("echo", json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_code, "missing_argument");

    const auto stats = get_value(registry.stats("echo"));
    EXPECT_EQ(stats.call_count, 1u);
    EXPECT_EQ(stats.error_count, 1u);
}

TEST(ToolRegistryTest, HandlerExceptionBecomesFailure) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor("explode"), [](const json&) -> Result<json> {
        throw std::runtime_error("disk on fire");
    });

    auto outcome = registry.invoke("explode", json{{"message", "x"}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_code, "handler_exception");
    EXPECT_NE(outcome.error.value().find("disk on fire"), std::string::npos);
    EXPECT_EQ(get_value(registry.stats("explode")).error_count, 1u);
}

TEST(ToolRegistryTest, NonStandardThrowBecomesFailure) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor("odd"), [](const json&) -> Result<json> {
        throw 42;
    });

    ToolCallResult outcome;
    EXPECT_NO_THROW(outcome = registry.invoke("odd", json{{"message", "x"}}));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_code, "handler_exception");

    const auto stats = get_value(registry.stats("odd"));
    EXPECT_EQ(stats.call_count, 1u);
    EXPECT_EQ(stats.success_count + stats.error_count, stats.call_count);
}

TEST(ToolRegistryTest, HandlerErrorKeepsItsCode) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor("refuse"), [](const json&) -> Result<json> {
        return BridgeError{ErrorCategory::Policy, "nope", "sandbox_violation"};
    });

    auto outcome = registry.invoke("refuse", json{{"message", "x"}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_code, "sandbox_violation");
    EXPECT_EQ(outcome.error.value(), "nope");
}

TEST(ToolRegistryTest, ReplacingKeepsPositionAndResetsStats) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor("first"), echo);
    registry.register_tool(echo_descriptor("second"), echo);
    ASSERT_TRUE(registry.invoke("first", json{{"message", "a"}}).success);

    registry.register_tool(echo_descriptor("first"), [](const json&) -> Result<json> {
        return json{{"version", 2}};
    });

    const auto catalog = registry.list();
    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog[0].name, "first");
    EXPECT_EQ(catalog[1].name, "second");
    EXPECT_EQ(get_value(registry.stats("first")).call_count, 0u);

    auto outcome = registry.invoke("first", json{{"message", "a"}});
    EXPECT_EQ(outcome.result["version"], 2);
}

TEST(ToolRegistryTest, DisabledToolIsHiddenAndUncallable) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor("visible"), echo);
    auto hidden = echo_descriptor("hidden");
    hidden.enabled = false;
    registry.register_tool(hidden, echo);

    EXPECT_EQ(registry.size(), 2u);
    ASSERT_EQ(registry.list().size(), 1u);
    EXPECT_EQ(registry.list()[0].name, "visible");

    auto outcome = registry.invoke("hidden", json{{"message", "x"}});
    EXPECT_EQ(outcome.error_code, "unknown_tool");
    EXPECT_EQ(get_value(registry.stats("hidden")).call_count, 0u);

    ASSERT_TRUE(registry.set_enabled("hidden", true));
    EXPECT_TRUE(registry.invoke("hidden", json{{"message", "x"}}).success);
}

TEST(ToolRegistryTest, UnregisterRemovesTool) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor(), echo);
    EXPECT_TRUE(registry.unregister_tool("echo"));
    EXPECT_FALSE(registry.unregister_tool("echo"));
    EXPECT_FALSE(registry.contains("echo"));
    EXPECT_TRUE(registry.list().empty());

    auto stats = registry.stats("echo");
    ASSERT_TRUE(is_error(stats));
    EXPECT_EQ(get_error(stats).code, "unknown_tool");
}

TEST(ToolRegistryTest, ConcurrentInvocationsKeepExactCounters) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor(), echo);

    constexpr int kThreads = 8;
    constexpr int kCallsPerThread = 50;
    std::atomic<int> successes{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&registry, &successes, t] {
            for (int i = 0; i < kCallsPerThread; ++i) {
                // Every other call omits the required argument.
                const json arguments =
                    (i % 2 == 0) ? json{{"message", std::to_string(t)}} : json::object();
                if (registry.invoke("echo", arguments).success) {
                    ++successes;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const auto stats = get_value(registry.stats("echo"));
    EXPECT_EQ(stats.call_count, static_cast<std::uint64_t>(kThreads * kCallsPerThread));
    EXPECT_EQ(stats.success_count, static_cast<std::uint64_t>(successes.load()));
    EXPECT_EQ(stats.success_count + stats.error_count, stats.call_count);
    EXPECT_EQ(stats.success_count, static_cast<std::uint64_t>(kThreads * kCallsPerThread / 2));
}

TEST(ToolRegistryTest, ResetStatsClearsEveryTool) {
    ToolRegistry registry;
    registry.register_tool(echo_descriptor("a"), echo);
    registry.register_tool(echo_descriptor("b"), echo);
    registry.invoke("a", json{{"message", "x"}});
    registry.invoke("b", json::object());

    registry.reset_stats();
    for (const auto& [name, stats] : registry.all_stats()) {
        EXPECT_EQ(stats.call_count, 0u) << name;
        EXPECT_FALSE(stats.last_used.has_value()) << name;
    }
}

}  // namespace
