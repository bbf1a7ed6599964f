#include <cctype>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "fake_channel.hpp"
#include "runtime/message_router.hpp"
#include "session/connection_registry.hpp"
#include "tools/tool_registry.hpp"

namespace {

using nlohmann::json;
using toolbridge::core::errors::BridgeError;
using toolbridge::core::errors::ErrorCategory;
using toolbridge::core::errors::Result;
using toolbridge::runtime::ChatCollaborator;
using toolbridge::runtime::ChatReply;
using toolbridge::runtime::ChatRequest;
using toolbridge::runtime::MessageRouter;
using toolbridge::runtime::ToolCallRecord;
using toolbridge::session::ConnectionRegistry;
using toolbridge::testing::FakeChannel;
using toolbridge::tools::ToolRegistry;

// Answers by calling the "upper" tool once, or fails when told to.
class ScriptedChat : public ChatCollaborator {
public:
    Result<ChatReply> complete(const ChatRequest& request, ToolRegistry& tools) override {
        last_request = request;
        if (fail) {
            return BridgeError{ErrorCategory::Execution, "model offline", "chat_failed"};
        }
        const json arguments = {{"text", request.message}};
        const auto outcome = tools.invoke("upper", arguments);
        ChatReply reply;
        reply.success = true;
        reply.result = json{{"response", outcome.result["text"]}};
        reply.tool_calls.push_back(
            ToolCallRecord{"upper", arguments, toolbridge::protocol::to_json(outcome)});
        reply.model_used = request.model;
        return reply;
    }

    ChatRequest last_request;
    bool fail = false;
};

class RouterFixture : public ::testing::Test {
protected:
    void SetUp() override {
        toolbridge::protocol::ToolDescriptor upper;
        upper.name = "upper";
        upper.description = "Uppercase text";
        upper.parameters = json{{"type", "object"},
                                {"properties", {{"text", {{"type", "string"}}}}},
                                {"required", json::array({"text"})}};
        tools.register_tool(upper, [](const json& arguments) -> Result<json> {
            std::string text = arguments.at("text").get<std::string>();
            for (auto& c : text) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return json{{"text", text}};
        });

        channel = std::make_shared<FakeChannel>();
        ASSERT_FALSE(toolbridge::core::errors::is_error(connections.accept(channel, std::string("c1"))));
        channel->clear();
    }

    ConnectionRegistry connections;
    ToolRegistry tools;
    std::shared_ptr<FakeChannel> channel;
};

TEST_F(RouterFixture, InvalidJsonGetsErrorReply) {
    MessageRouter router(connections, tools);
    router.handle("c1", "{oops");

    const json reply = channel->last_frame();
    EXPECT_EQ(reply["type"], "error");
    EXPECT_EQ(reply["data"]["message"], "Invalid JSON format");
    EXPECT_EQ(reply["data"]["code"], "invalid_json");
    EXPECT_NE(connections.find("c1"), nullptr);
}

TEST_F(RouterFixture, UnknownKindIsEchoed) {
    MessageRouter router(connections, tools);
    router.handle("c1", R"({"type": "teleport", "data": {}})");

    const json reply = channel->last_frame();
    EXPECT_EQ(reply["type"], "error");
    EXPECT_EQ(reply["data"]["message"], "Unknown message type: teleport");
    EXPECT_EQ(reply["data"]["code"], "unrecognized_message_kind");
}

TEST_F(RouterFixture, ServerKindsAreRefused) {
    MessageRouter router(connections, tools);
    router.handle("c1", R"({"type": "chat_response", "data": {}})");
    EXPECT_EQ(channel->last_frame()["data"]["code"], "unsupported_message_kind");
}

TEST_F(RouterFixture, PingIsAnsweredWithPong) {
    MessageRouter router(connections, tools);
    router.handle("c1", R"({"type": "ping", "data": {"timestamp": 12345}})");

    const json reply = channel->last_frame();
    EXPECT_EQ(reply["type"], "pong");
    EXPECT_EQ(reply["data"]["ping_timestamp"], 12345);
    EXPECT_TRUE(reply["data"].contains("timestamp"));
    EXPECT_TRUE(connections.find("c1")->last_pong_received().has_value());
}

TEST_F(RouterFixture, PongIsRecordedSilently) {
    MessageRouter router(connections, tools);
    router.handle("c1", R"({"type": "pong", "data": {}})");
    EXPECT_EQ(channel->frame_count(), 0u);
    EXPECT_TRUE(connections.find("c1")->last_pong_received().has_value());
}

TEST_F(RouterFixture, ConfigMergesMetadata) {
    MessageRouter router(connections, tools);
    router.handle("c1", R"({"type": "config", "data": {"model": "gpt-4", "temperature": 0.1}})");

    const json reply = channel->last_frame();
    EXPECT_EQ(reply["type"], "system");
    EXPECT_EQ(reply["data"]["message"], "Configuration updated");
    EXPECT_EQ(connections.find("c1")->metadata()["model"], "gpt-4");
}

TEST_F(RouterFixture, DirectToolCallReportsOutcome) {
    MessageRouter router(connections, tools);
    router.handle("c1", R"({"type": "chat", "data": {"tool": "upper", "arguments": {"text": "abc"}}})");

    const auto frames = channel->frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0]["type"], "processing");
    EXPECT_EQ(frames[1]["type"], "chat_response");
    EXPECT_EQ(frames[1]["data"]["success"], true);
    EXPECT_EQ(frames[1]["data"]["result"]["text"], "ABC");
    ASSERT_EQ(frames[1]["data"]["tool_calls"].size(), 1u);
    EXPECT_EQ(frames[1]["data"]["tool_calls"][0]["tool_name"], "upper");
    EXPECT_EQ(frames[1]["data"]["tool_calls"][0]["result"]["success"], true);
}

TEST_F(RouterFixture, DirectCallToUnknownToolFailsInsideResponse) {
    MessageRouter router(connections, tools);
    router.handle("c1", R"({"type": "chat", "data": {"tool": "nope"}})");

    const json reply = channel->last_frame();
    EXPECT_EQ(reply["type"], "chat_response");
    EXPECT_EQ(reply["data"]["success"], false);
    EXPECT_EQ(reply["data"]["error"], "Unknown tool: nope. Available tools: upper");
}

TEST_F(RouterFixture, ChatWithoutCollaboratorIsUnavailable) {
    MessageRouter router(connections, tools);
    EXPECT_FALSE(router.chat_available());
    router.handle("c1", R"({"type": "chat", "data": {"message": "hello"}})");
    EXPECT_EQ(channel->last_frame()["data"]["code"], "chat_unavailable");
}

TEST_F(RouterFixture, EmptyChatMessageIsRejected) {
    auto chat = std::make_shared<ScriptedChat>();
    MessageRouter router(connections, tools, chat);
    router.handle("c1", R"({"type": "chat", "data": {"message": ""}})");
    EXPECT_EQ(channel->last_frame()["data"]["code"], "missing_argument");
}

TEST_F(RouterFixture, ChatRunsCollaborator) {
    auto chat = std::make_shared<ScriptedChat>();
    MessageRouter router(connections, tools, chat);
    router.handle("c1", R"({"type": "chat", "data": {"message": "hi there", "model": "gpt-4"}})");

    EXPECT_EQ(chat->last_request.client_id, "c1");
    EXPECT_EQ(chat->last_request.model, "gpt-4");
    EXPECT_DOUBLE_EQ(chat->last_request.temperature, 0.7);

    const auto frames = channel->frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0]["type"], "processing");
    EXPECT_EQ(frames[1]["data"]["result"]["response"], "HI THERE");
    EXPECT_EQ(frames[1]["data"]["model_used"], "gpt-4");
}

TEST_F(RouterFixture, ChatFailureBecomesError) {
    auto chat = std::make_shared<ScriptedChat>();
    chat->fail = true;
    MessageRouter router(connections, tools, chat);
    router.handle("c1", R"({"type": "chat", "data": {"message": "hi"}})");

    const json reply = channel->last_frame();
    EXPECT_EQ(reply["type"], "error");
    EXPECT_EQ(reply["data"]["message"], "Chat failed: model offline");
}

TEST_F(RouterFixture, RepliesToVanishedConnectionAreDropped) {
    MessageRouter router(connections, tools);
    router.handle("ghost", R"({"type": "ping", "data": {}})");
    EXPECT_EQ(channel->frame_count(), 0u);
}

}  // namespace
