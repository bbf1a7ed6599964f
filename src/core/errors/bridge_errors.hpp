#pragma once
#include <string>
#include <variant>

namespace toolbridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., a tool call is missing an argument
        Execution,  // E.g., a tool handler failed on disk I/O
        Transport,  // E.g., a send on a duplex channel failed
        Policy,     // E.g., a path escapes the sandbox
        Internal    // E.g., logic bug or parsing failure
    };

    // The standardized error payload
    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the caller
        };

    // Stable machine-readable codes carried in BridgeError::code.
    namespace codes {
        inline constexpr const char* kCapacityExceeded = "capacity_exceeded";
        inline constexpr const char* kRegistryClosed = "registry_closed";
        inline constexpr const char* kUnknownConnection = "unknown_connection";
        inline constexpr const char* kTransportFailure = "transport_failure";
        inline constexpr const char* kUnknownTool = "unknown_tool";
        inline constexpr const char* kMissingArgument = "missing_argument";
        inline constexpr const char* kInvalidArgument = "invalid_argument";
        inline constexpr const char* kSandboxViolation = "sandbox_violation";
        inline constexpr const char* kNotFound = "not_found";
        inline constexpr const char* kWrongType = "wrong_type";
        inline constexpr const char* kTooLarge = "too_large";
        inline constexpr const char* kDecodeFailure = "decode_failure";
        inline constexpr const char* kIoFailure = "io_failure";
        inline constexpr const char* kUnrecognizedMessageKind = "unrecognized_message_kind";
        inline constexpr const char* kUnsupportedMessageKind = "unsupported_message_kind";
        inline constexpr const char* kInvalidJson = "invalid_json";
        inline constexpr const char* kChatUnavailable = "chat_unavailable";
        inline constexpr const char* kDeviceUnreachable = "device_unreachable";
        inline constexpr const char* kDeviceCommandFailed = "device_command_failed";
        inline constexpr const char* kInvalidConfig = "invalid_config";
        inline constexpr const char* kHandlerException = "handler_exception";
    }  // namespace codes

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace toolbridge::core::errors
