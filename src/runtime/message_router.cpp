#include "runtime/message_router.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "session/connection_registry.hpp"
#include "tools/tool_registry.hpp"

namespace toolbridge::runtime {

using nlohmann::json;
using protocol::MessageKind;
namespace codes = core::errors::codes;

json to_json(const ToolCallRecord& record) {
    return json{{"tool_name", record.tool_name},
                {"arguments", record.arguments},
                {"result", record.result}};
}

json to_json(const ChatReply& reply) {
    json calls = json::array();
    for (const auto& call : reply.tool_calls) {
        calls.push_back(to_json(call));
    }
    json payload;
    payload["success"] = reply.success;
    payload["result"] = reply.result;
    payload["error"] = reply.error.has_value() ? json(reply.error.value()) : json(nullptr);
    payload["tool_calls"] = std::move(calls);
    payload["model_used"] =
        reply.model_used.has_value() ? json(reply.model_used.value()) : json(nullptr);
    return payload;
}

MessageRouter::MessageRouter(session::ConnectionRegistry& connections, tools::ToolRegistry& tools,
                             std::shared_ptr<ChatCollaborator> chat)
    : connections_(connections), tools_(tools), chat_(std::move(chat)) {}

void MessageRouter::handle(const std::string& connection_id, const std::string& text) {
    auto decoded = protocol::decode(text);
    if (core::errors::is_error(decoded)) {
        const auto& error = core::errors::get_error(decoded);
        LOG_WARN("MessageRouter: bad frame from " + connection_id + ": " + error.message);
        reply_error(connection_id, "Invalid JSON format", error.code);
        return;
    }

    const auto& message = core::errors::get_value(decoded);
    LOG_DEBUG("MessageRouter: " + message.raw_kind + " from " + connection_id);
    try {
        dispatch(connection_id, message);
    } catch (const std::exception& e) {
        LOG_ERROR("MessageRouter: failed to handle " + message.raw_kind + " from " +
                  connection_id + ": " + e.what());
        reply_error(connection_id, std::string("Error while processing message: ") + e.what(),
                    "");
    }
}

void MessageRouter::dispatch(const std::string& connection_id,
                             const protocol::InboundMessage& message) {
    if (!message.kind.has_value()) {
        reply_error(connection_id, "Unknown message type: " + message.raw_kind,
                    codes::kUnrecognizedMessageKind);
        return;
    }

    const MessageKind kind = message.kind.value();
    if (protocol::is_server_originated(kind)) {
        reply_error(connection_id,
                    "Message type " + message.raw_kind + " cannot be sent by a client",
                    codes::kUnsupportedMessageKind);
        return;
    }

    switch (kind) {
        case MessageKind::Ping:
            handle_ping(connection_id, message.data);
            break;
        case MessageKind::Pong:
            connections_.record_pong(connection_id);
            break;
        case MessageKind::Config:
            handle_config(connection_id, message.data);
            break;
        case MessageKind::Chat:
            if (message.data.contains("tool")) {
                handle_tool_call(connection_id, message.data);
            } else {
                handle_chat(connection_id, message.data);
            }
            break;
        default:
            reply_error(connection_id, "Unknown message type: " + message.raw_kind,
                        codes::kUnrecognizedMessageKind);
            break;
    }
}

void MessageRouter::handle_ping(const std::string& connection_id, const json& data) {
    connections_.record_pong(connection_id);
    json pong;
    pong["ping_timestamp"] = data.contains("timestamp") ? data.at("timestamp") : json(nullptr);
    reply(connection_id, MessageKind::Pong, std::move(pong));
}

void MessageRouter::handle_config(const std::string& connection_id, const json& data) {
    if (!connections_.update_metadata(connection_id, data)) {
        return;
    }
    json ack;
    ack["message"] = "Configuration updated";
    ack["keys"] = json::array();
    for (const auto& item : data.items()) {
        ack["keys"].push_back(item.key());
    }
    reply(connection_id, MessageKind::System, std::move(ack));
}

void MessageRouter::handle_tool_call(const std::string& connection_id, const json& data) {
    const auto& tool = data.at("tool");
    if (!tool.is_string() || tool.get<std::string>().empty()) {
        reply_error(connection_id, "Field 'tool' must be a non-empty string",
                    codes::kInvalidArgument);
        return;
    }
    const std::string tool_name = tool.get<std::string>();
    const json arguments =
        data.contains("arguments") && data.at("arguments").is_object() ? data.at("arguments")
                                                                    : json::object();

    reply(connection_id, MessageKind::Processing,
          json{{"message", "Running tool " + tool_name}});
    const auto outcome = tools_.invoke(tool_name, arguments);

    ChatReply chat_reply;
    chat_reply.success = outcome.success;
    chat_reply.result = outcome.result;
    chat_reply.error = outcome.error;
    chat_reply.tool_calls.push_back(
        ToolCallRecord{tool_name, arguments, protocol::to_json(outcome)});
    reply(connection_id, MessageKind::ChatResponse, to_json(chat_reply));
}

void MessageRouter::handle_chat(const std::string& connection_id, const json& data) {
    ChatRequest request;
    request.client_id = connection_id;
    request.message = data.value("message", std::string());
    if (request.message.empty()) {
        reply_error(connection_id, "Message content must not be empty",
                    codes::kMissingArgument);
        return;
    }
    if (!chat_) {
        reply_error(connection_id, "Chat is not available on this server",
                    codes::kChatUnavailable);
        return;
    }
    request.model = data.value("model", request.model);
    request.temperature = data.value("temperature", request.temperature);
    request.max_tokens = data.value("max_tokens", request.max_tokens);

    reply(connection_id, MessageKind::Processing,
          json{{"message", "Processing your message..."}});
    auto completed = chat_->complete(request, tools_);
    if (core::errors::is_error(completed)) {
        const auto& error = core::errors::get_error(completed);
        LOG_ERROR("MessageRouter: chat for " + connection_id + " failed: " + error.message);
        reply_error(connection_id, "Chat failed: " + error.message, error.code);
        return;
    }

    const auto& chat_reply = core::errors::get_value(completed);
    LOG_INFO("MessageRouter: chat for " + connection_id + " finished, " +
             std::to_string(chat_reply.tool_calls.size()) + " tool call(s)");
    reply(connection_id, MessageKind::ChatResponse, to_json(chat_reply));
}

void MessageRouter::reply(const std::string& connection_id, const MessageKind kind, json data) {
    connections_.send(connection_id, protocol::make_envelope(kind, std::move(data)));
}

void MessageRouter::reply_error(const std::string& connection_id, const std::string& message,
                                const std::string& code) {
    connections_.send(connection_id, protocol::make_error_envelope(message, code));
}

}  // namespace toolbridge::runtime
