#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::protocol {

    // Every kind a duplex envelope may carry in its "type" field.
    enum class MessageKind {
        Chat,
        Config,
        Ping,
        Pong,
        Processing,
        ChatResponse,
        Error,
        System
    };

    // Outbound (and validated inbound) protocol unit: {"type": ..., "data": {...}}
    struct Envelope {
        MessageKind kind;
        nlohmann::json data = nlohmann::json::object();
    };

    // Inbound frame after JSON decoding. The kind stays raw until dispatch so an
    // unknown value can be echoed back to the sender.
    struct InboundMessage {
        std::string raw_kind;
        std::optional<MessageKind> kind;
        nlohmann::json data = nlohmann::json::object();
    };

    std::string to_string(MessageKind kind);
    std::optional<MessageKind> parse_message_kind(const std::string& value);

    // Kinds that only the server produces.
    bool is_server_originated(MessageKind kind);

    double unix_timestamp_now();

    // Builds an envelope; ping/pong/processing/chat_response/error/system get a
    // data.timestamp when the caller did not set one.
    Envelope make_envelope(MessageKind kind, nlohmann::json data = nlohmann::json::object());
    Envelope make_error_envelope(const std::string& message, const std::string& code = "");

    std::string encode(const Envelope& envelope);
    nlohmann::json to_json(const Envelope& envelope);

    // Fails with invalid_json for unparsable text or a non-object frame.
    core::errors::Result<InboundMessage> decode(const std::string& text);

} // namespace toolbridge::protocol
