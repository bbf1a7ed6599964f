#include "protocol/message_contract.hpp"

#include <chrono>
#include <utility>

namespace toolbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

bool carries_timestamp(const MessageKind kind) {
    switch (kind) {
        case MessageKind::Ping:
        case MessageKind::Pong:
        case MessageKind::Processing:
        case MessageKind::ChatResponse:
        case MessageKind::Error:
        case MessageKind::System:
            return true;
        default:
            return false;
    }
}

}  // namespace

std::string to_string(const MessageKind kind) {
    switch (kind) {
        case MessageKind::Chat:
            return "chat";
        case MessageKind::Config:
            return "config";
        case MessageKind::Ping:
            return "ping";
        case MessageKind::Pong:
            return "pong";
        case MessageKind::Processing:
            return "processing";
        case MessageKind::ChatResponse:
            return "chat_response";
        case MessageKind::Error:
            return "error";
        case MessageKind::System:
            return "system";
        default:
            return "unknown";
    }
}

std::optional<MessageKind> parse_message_kind(const std::string& value) {
    if (value == "chat") return MessageKind::Chat;
    if (value == "config") return MessageKind::Config;
    if (value == "ping") return MessageKind::Ping;
    if (value == "pong") return MessageKind::Pong;
    if (value == "processing") return MessageKind::Processing;
    if (value == "chat_response") return MessageKind::ChatResponse;
    if (value == "error") return MessageKind::Error;
    if (value == "system") return MessageKind::System;
    return std::nullopt;
}

bool is_server_originated(const MessageKind kind) {
    return kind == MessageKind::Processing || kind == MessageKind::ChatResponse ||
           kind == MessageKind::Error || kind == MessageKind::System;
}

double unix_timestamp_now() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

Envelope make_envelope(const MessageKind kind, json data) {
    if (!data.is_object()) {
        data = json{{"value", std::move(data)}};
    }
    if (carries_timestamp(kind) && !data.contains("timestamp")) {
        data["timestamp"] = unix_timestamp_now();
    }
    return Envelope{kind, std::move(data)};
}

Envelope make_error_envelope(const std::string& message, const std::string& code) {
    json data;
    data["message"] = message;
    if (!code.empty()) {
        data["code"] = code;
    }
    return make_envelope(MessageKind::Error, std::move(data));
}

json to_json(const Envelope& envelope) {
    return json{{"type", to_string(envelope.kind)}, {"data", envelope.data}};
}

std::string encode(const Envelope& envelope) {
    // Replace invalid UTF-8 instead of throwing; file content may be arbitrary.
    return to_json(envelope).dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<InboundMessage> decode(const std::string& text) {
    const json frame = json::parse(text, nullptr, false);
    if (frame.is_discarded()) {
        return BridgeError{ErrorCategory::Input, "Invalid JSON format", codes::kInvalidJson};
    }
    if (!frame.is_object()) {
        return BridgeError{ErrorCategory::Input, "Message must be a JSON object",
                           codes::kInvalidJson};
    }

    InboundMessage message;
    const auto type_it = frame.find("type");
    if (type_it == frame.end() || !type_it->is_string()) {
        message.raw_kind = "unknown";
    } else {
        message.raw_kind = type_it->get<std::string>();
    }
    message.kind = parse_message_kind(message.raw_kind);

    const auto data_it = frame.find("data");
    if (data_it != frame.end() && data_it->is_object()) {
        message.data = *data_it;
    }
    return message;
}

}  // namespace toolbridge::protocol
