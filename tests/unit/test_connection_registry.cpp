#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "fake_channel.hpp"
#include "protocol/message_contract.hpp"
#include "session/connection_registry.hpp"

namespace {

using nlohmann::json;
using toolbridge::core::errors::get_error;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;
using toolbridge::protocol::make_envelope;
using toolbridge::protocol::MessageKind;
using toolbridge::session::Connection;
using toolbridge::session::ConnectionRegistry;
using toolbridge::session::RegistryOptions;
using toolbridge::testing::FakeChannel;

RegistryOptions options_with_limit(std::size_t max_connections) {
    RegistryOptions options;
    options.max_connections = max_connections;
    return options;
}

std::shared_ptr<toolbridge::session::Connection> must_accept(
    ConnectionRegistry& registry, const std::shared_ptr<FakeChannel>& channel,
    const std::string& id) {
    auto accepted = registry.accept(channel, id);
    EXPECT_FALSE(is_error(accepted)) << id;
    return is_error(accepted) ? nullptr : get_value(accepted);
}

TEST(ConnectionRegistryTest, AcceptSendsWelcome) {
    ConnectionRegistry registry;
    auto channel = std::make_shared<FakeChannel>();
    auto connection = must_accept(registry, channel, "alice");
    ASSERT_NE(connection, nullptr);

    EXPECT_EQ(connection->id(), "alice");
    EXPECT_EQ(registry.size(), 1u);
    const json welcome = channel->last_frame();
    EXPECT_EQ(welcome["type"], "system");
    EXPECT_EQ(welcome["data"]["client_id"], "alice");
    EXPECT_EQ(welcome["data"]["server_info"]["name"], "toolbridge");
    EXPECT_EQ(welcome["data"]["server_info"]["capabilities"],
              json::array({"tools", "chat", "websocket"}));
    EXPECT_EQ(connection->message_count(), 1u);
}

TEST(ConnectionRegistryTest, GeneratesDistinctIdsFromPeer) {
    ConnectionRegistry registry;
    auto first = registry.accept(std::make_shared<FakeChannel>("192.168.1.5"));
    auto second = registry.accept(std::make_shared<FakeChannel>("192.168.1.5"));
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));

    const auto& first_id = get_value(first)->id();
    const auto& second_id = get_value(second)->id();
    EXPECT_NE(first_id, second_id);
    EXPECT_EQ(first_id.rfind("192.168.1.5_", 0), 0u);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(ConnectionRegistryTest, EnforcesCapacityAndFreesSlotsOnDisconnect) {
    ConnectionRegistry registry(options_with_limit(2));
    must_accept(registry, std::make_shared<FakeChannel>(), "a");
    must_accept(registry, std::make_shared<FakeChannel>(), "b");

    auto rejected = registry.accept(std::make_shared<FakeChannel>(), std::string("c"));
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).code, "capacity_exceeded");
    EXPECT_EQ(registry.size(), 2u);

    EXPECT_TRUE(registry.disconnect("a", "client disconnected"));
    auto admitted = registry.accept(std::make_shared<FakeChannel>(), std::string("c"));
    ASSERT_FALSE(is_error(admitted));
    EXPECT_EQ(registry.connection_ids(), (std::vector<std::string>{"b", "c"}));
}

TEST(ConnectionRegistryTest, DisconnectNotifiesPeerAndListenerOnce) {
    ConnectionRegistry registry;
    std::vector<std::pair<std::string, std::string>> events;
    registry.set_disconnect_listener(
        [&events](const std::shared_ptr<Connection>& connection, const std::string& reason) {
            events.emplace_back(connection->id(), reason);
        });
    auto channel = std::make_shared<FakeChannel>();
    must_accept(registry, channel, "bob");

    EXPECT_TRUE(registry.disconnect("bob", "heartbeat timeout"));
    EXPECT_FALSE(registry.disconnect("bob", "heartbeat timeout"));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, "bob");
    EXPECT_EQ(events[0].second, "heartbeat timeout");
    EXPECT_EQ(channel->close_calls.load(), 1);
    const json notice = channel->last_frame();
    EXPECT_EQ(notice["type"], "system");
    EXPECT_EQ(notice["data"]["reason"], "heartbeat timeout");
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ConnectionRegistryTest, SendFailureDisconnectsPeer) {
    ConnectionRegistry registry;
    auto channel = std::make_shared<FakeChannel>();
    must_accept(registry, channel, "flaky");
    channel->fail_sends = true;

    EXPECT_FALSE(registry.send("flaky", make_envelope(MessageKind::Processing)));
    EXPECT_EQ(registry.find("flaky"), nullptr);
    EXPECT_EQ(channel->close_calls.load(), 1);
    EXPECT_FALSE(registry.send("flaky", make_envelope(MessageKind::Processing)));
}

TEST(ConnectionRegistryTest, BroadcastSkipsExcludedAndDropsDeadPeers) {
    ConnectionRegistry registry;
    auto healthy = std::make_shared<FakeChannel>();
    auto dead = std::make_shared<FakeChannel>();
    auto excluded = std::make_shared<FakeChannel>();
    must_accept(registry, healthy, "healthy");
    must_accept(registry, dead, "dead");
    must_accept(registry, excluded, "excluded");
    dead->fail_sends = true;
    const std::size_t excluded_frames = excluded->frame_count();

    const auto report = registry.broadcast(
        make_envelope(MessageKind::System, json{{"message", "maintenance"}}), {"excluded"});

    EXPECT_EQ(report.delivered, std::vector<std::string>{"healthy"});
    EXPECT_EQ(report.failed, std::vector<std::string>{"dead"});
    EXPECT_EQ(healthy->last_frame()["data"]["message"], "maintenance");
    EXPECT_EQ(excluded->frame_count(), excluded_frames);
    EXPECT_EQ(registry.connection_ids(), (std::vector<std::string>{"excluded", "healthy"}));
}

TEST(ConnectionRegistryTest, DuplicateIdReplacesPreviousHolder) {
    ConnectionRegistry registry;
    std::vector<std::string> reasons;
    std::vector<std::shared_ptr<Connection>> gone;
    registry.set_disconnect_listener(
        [&reasons, &gone](const std::shared_ptr<Connection>& connection, const std::string& reason) {
            reasons.push_back(reason);
            gone.push_back(connection);
        });
    auto old_channel = std::make_shared<FakeChannel>("10.0.0.1");
    auto new_channel = std::make_shared<FakeChannel>("10.0.0.2");
    auto old_connection = must_accept(registry, old_channel, "shared");
    auto new_connection = must_accept(registry, new_channel, "shared");

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("shared"), new_connection);
    EXPECT_EQ(old_channel->close_calls.load(), 1);
    EXPECT_EQ(old_channel->last_frame()["data"]["reason"], "replaced by new connection");
    EXPECT_EQ(reasons, std::vector<std::string>{"replaced by new connection"});
    // The listener sees the evicted instance, not the live one sharing its id.
    ASSERT_EQ(gone.size(), 1u);
    EXPECT_EQ(gone[0], old_connection);
    EXPECT_NE(gone[0], new_connection);

    // The old session ending later must not evict the new holder.
    EXPECT_FALSE(registry.release(old_connection, "client disconnected"));
    EXPECT_EQ(registry.find("shared"), new_connection);
}

TEST(ConnectionRegistryTest, WelcomeFailureLeavesNoEntry) {
    ConnectionRegistry registry;
    auto channel = std::make_shared<FakeChannel>();
    channel->fail_sends = true;

    auto accepted = registry.accept(channel, std::string("ghost"));
    ASSERT_TRUE(is_error(accepted));
    EXPECT_EQ(get_error(accepted).code, "transport_failure");
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(channel->close_calls.load(), 1);
}

TEST(ConnectionRegistryTest, ShutdownClosesEveryoneAndRejectsAccepts) {
    ConnectionRegistry registry;
    auto first = std::make_shared<FakeChannel>();
    auto second = std::make_shared<FakeChannel>();
    must_accept(registry, first, "one");
    must_accept(registry, second, "two");

    registry.shutdown();
    registry.shutdown();
    EXPECT_TRUE(registry.closed());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(first->close_calls.load(), 1);
    EXPECT_EQ(second->close_calls.load(), 1);
    EXPECT_EQ(first->last_frame()["data"]["reason"], "server shutdown");

    auto late = registry.accept(std::make_shared<FakeChannel>(), std::string("late"));
    ASSERT_TRUE(is_error(late));
    EXPECT_EQ(get_error(late).code, "registry_closed");
}

TEST(ConnectionRegistryTest, MetadataAndStats) {
    ConnectionRegistry registry(options_with_limit(5));
    auto channel = std::make_shared<FakeChannel>();
    must_accept(registry, channel, "meta");

    EXPECT_TRUE(registry.update_metadata("meta", json{{"model", "gpt-4"}}));
    EXPECT_TRUE(registry.update_metadata("meta", json{{"temperature", 0.2}}));
    EXPECT_FALSE(registry.update_metadata("nobody", json{{"x", 1}}));
    EXPECT_TRUE(registry.send("meta", make_envelope(MessageKind::Processing)));

    const auto stats = registry.stats();
    EXPECT_EQ(stats.total_connections, 1u);
    EXPECT_EQ(stats.max_connections, 5u);
    EXPECT_EQ(stats.total_messages, 2u);
    EXPECT_EQ(stats.alive_connections, 1u);

    const json info = registry.connections_info();
    ASSERT_EQ(info.size(), 1u);
    EXPECT_EQ(info[0]["client_id"], "meta");
    EXPECT_EQ(info[0]["peer_address"], "10.0.0.1");
    EXPECT_EQ(info[0]["metadata"], (json{{"model", "gpt-4"}, {"temperature", 0.2}}));
    EXPECT_TRUE(info[0]["last_ping"].is_null());
    EXPECT_EQ(info[0]["is_alive"], true);
}

}  // namespace
