#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge::protocol {

// Canonical argument name -> accepted aliases from inconsistent callers.
using ArgumentSynonyms = std::vector<std::pair<std::string, std::vector<std::string>>>;

// Static definition of a callable operation, advertised in the catalog.
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();  // JSON schema subset
    bool enabled = true;
    ArgumentSynonyms synonyms;                              // not advertised
};

// Uniform outcome of one invocation: {success, result, error} on the wire.
struct ToolCallResult {
    bool success = false;
    nlohmann::json result;            // null on failure
    std::optional<std::string> error;
    std::string error_code;           // empty on success
    double duration_ms = 0.0;
};

struct ToolStats {
    std::uint64_t call_count = 0;
    std::uint64_t success_count = 0;
    std::uint64_t error_count = 0;
    std::optional<double> last_used;  // unix seconds
};

// One execution attempt; only feeds ToolStats and the log, never retained.
struct ToolInvocation {
    std::string tool_name;
    nlohmann::json arguments;
    std::chrono::steady_clock::time_point started;
    bool success = false;
    std::string error_message;
    double duration_ms = 0.0;
};

inline nlohmann::json to_json(const ToolDescriptor& descriptor) {
    return nlohmann::json{{"name", descriptor.name},
                          {"description", descriptor.description},
                          {"inputSchema", descriptor.parameters}};
}

inline nlohmann::json to_json(const ToolCallResult& result) {
    nlohmann::json payload;
    payload["success"] = result.success;
    payload["result"] = result.result;
    payload["error"] = result.error.has_value() ? nlohmann::json(result.error.value())
                                                : nlohmann::json(nullptr);
    return payload;
}

inline nlohmann::json to_json(const ToolStats& stats) {
    nlohmann::json payload;
    payload["call_count"] = stats.call_count;
    payload["success_count"] = stats.success_count;
    payload["error_count"] = stats.error_count;
    payload["last_used"] = stats.last_used.has_value() ? nlohmann::json(stats.last_used.value())
                                                       : nlohmann::json(nullptr);
    return payload;
}

}  // namespace toolbridge::protocol
