#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/message_contract.hpp"

namespace toolbridge::session {
class ConnectionRegistry;
}

namespace toolbridge::tools {
class ToolRegistry;
}

namespace toolbridge::runtime {

struct ChatRequest {
    std::string client_id;
    std::string message;
    std::string model = "gpt-3.5-turbo";
    double temperature = 0.7;
    int max_tokens = 1000;
};

struct ToolCallRecord {
    std::string tool_name;
    nlohmann::json arguments = nlohmann::json::object();
    nlohmann::json result;
};

struct ChatReply {
    bool success = false;
    nlohmann::json result;
    std::optional<std::string> error;
    std::vector<ToolCallRecord> tool_calls;
    std::optional<std::string> model_used;
};

nlohmann::json to_json(const ToolCallRecord& record);
nlohmann::json to_json(const ChatReply& reply);

// Produces chat completions; may call back into the tool registry.
class ChatCollaborator {
public:
    virtual ~ChatCollaborator() = default;
    virtual core::errors::Result<ChatReply> complete(const ChatRequest& request,
                                                     tools::ToolRegistry& tools) = 0;
};

// Decodes inbound duplex frames and answers through the connection registry.
// Calls for one connection must be made sequentially.
class MessageRouter {
public:
    MessageRouter(session::ConnectionRegistry& connections, tools::ToolRegistry& tools,
                  std::shared_ptr<ChatCollaborator> chat = nullptr);

    void handle(const std::string& connection_id, const std::string& text);

    bool chat_available() const { return chat_ != nullptr; }

private:
    void dispatch(const std::string& connection_id, const protocol::InboundMessage& message);
    void handle_ping(const std::string& connection_id, const nlohmann::json& data);
    void handle_config(const std::string& connection_id, const nlohmann::json& data);
    void handle_chat(const std::string& connection_id, const nlohmann::json& data);
    void handle_tool_call(const std::string& connection_id, const nlohmann::json& data);
    void reply(const std::string& connection_id, protocol::MessageKind kind,
               nlohmann::json data);
    void reply_error(const std::string& connection_id, const std::string& message,
                     const std::string& code);

    session::ConnectionRegistry& connections_;
    tools::ToolRegistry& tools_;
    std::shared_ptr<ChatCollaborator> chat_;
};

}  // namespace toolbridge::runtime
