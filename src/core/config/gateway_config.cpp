#include "core/config/gateway_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace toolbridge::core::config {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
namespace codes = core::errors::codes;

namespace {

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string trim(const std::string& value) {
    std::size_t start = 0;
    while (start < value.size() &&
           std::isspace(static_cast<unsigned char>(value[start])) != 0) {
        ++start;
    }
    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::vector<std::string> split_csv(const std::string& value) {
    std::vector<std::string> out;
    std::string current;
    for (const char c : value) {
        if (c == ',') {
            current = trim(current);
            if (!current.empty()) {
                out.push_back(current);
            }
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    current = trim(current);
    if (!current.empty()) {
        out.push_back(current);
    }
    return out;
}

template <typename T>
core::errors::Result<T> parse_unsigned(const std::string& name, const std::string& raw) {
    T value = 0;
    const char* begin = raw.data();
    const char* end = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return BridgeError{ErrorCategory::Input,
                           "Invalid number for " + name + ": " + raw,
                           codes::kInvalidConfig, "Provide a non-negative integer."};
    }
    return value;
}

core::errors::Result<bool> parse_bool(const std::string& name, const std::string& raw) {
    const std::string v = lowercase(trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    return BridgeError{ErrorCategory::Input, "Invalid boolean for " + name + ": " + raw,
                       codes::kInvalidConfig, "Use true/false, yes/no, on/off or 1/0."};
}

core::errors::Result<std::chrono::milliseconds> parse_seconds(const std::string& name,
                                                               const std::string& raw) {
    auto parsed = parse_unsigned<std::uint32_t>(name, raw);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    return std::chrono::milliseconds(
        static_cast<std::int64_t>(core::errors::get_value(parsed)) * 1000);
}

std::vector<std::string> normalize_extensions(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    out.reserve(raw.size());
    for (const auto& ext : raw) {
        std::string normalized = lowercase(ext);
        if (!normalized.empty() && normalized.front() != '.') {
            normalized.insert(normalized.begin(), '.');
        }
        out.push_back(normalized);
    }
    return out;
}

}  // namespace

std::string to_string(const LivenessPolicy policy) {
    switch (policy) {
        case LivenessPolicy::UnansweredPing:
            return "unanswered_ping";
        case LivenessPolicy::LastPingWindow:
            return "last_ping_window";
        default:
            return "unknown";
    }
}

bool is_tool_enabled(const GatewayConfig& config, const std::string& tool_name) {
    return std::find(config.enabled_tools.begin(), config.enabled_tools.end(), tool_name) !=
           config.enabled_tools.end();
}

core::errors::Result<DeviceConfig> parse_device_url(const std::string& url,
                                                     DeviceConfig base) {
    std::string s = trim(url);
    if (s.rfind("http://", 0) == 0) {
        s = s.substr(7);
    } else if (s.rfind("https://", 0) == 0) {
        return BridgeError{ErrorCategory::Input, "HTTPS device endpoints are not supported: " + url,
                           codes::kInvalidConfig};
    }

    const auto slash = s.find('/');
    if (slash != std::string::npos) {
        s = s.substr(0, slash);
    }

    const auto colon = s.rfind(':');
    if (colon != std::string::npos) {
        auto port = parse_unsigned<std::uint16_t>("device port", s.substr(colon + 1));
        if (core::errors::is_error(port)) {
            return core::errors::get_error(port);
        }
        base.port = core::errors::get_value(port);
        s = s.substr(0, colon);
    }
    if (s.empty()) {
        return BridgeError{ErrorCategory::Input, "Device URL has no host: " + url,
                           codes::kInvalidConfig};
    }
    base.host = s;
    base.enabled = true;
    return base;
}

core::errors::Result<GatewayConfig> load_config_from_env(GatewayConfig base) {
    GatewayConfig cfg = std::move(base);

    if (auto host = get_env("TOOLBRIDGE_HOST"); !host.empty()) {
        cfg.listen.host = host;
    }
    if (auto port = get_env("TOOLBRIDGE_PORT"); !port.empty()) {
        auto parsed = parse_unsigned<std::uint16_t>("TOOLBRIDGE_PORT", port);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.listen.port = core::errors::get_value(parsed);
    }
    if (auto timeout = get_env("TOOLBRIDGE_SEND_TIMEOUT_SEC"); !timeout.empty()) {
        auto parsed = parse_seconds("TOOLBRIDGE_SEND_TIMEOUT_SEC", timeout);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.listen.send_timeout = core::errors::get_value(parsed);
    }

    if (auto dir = get_env("TOOLBRIDGE_BASE_DIR"); !dir.empty()) {
        cfg.sandbox.base_directory = dir;
    }
    if (const char* exts = std::getenv("TOOLBRIDGE_ALLOWED_EXTENSIONS"); exts != nullptr) {
        // An explicitly empty value lifts the extension restriction.
        cfg.sandbox.allowed_extensions = normalize_extensions(split_csv(exts));
    }
    if (auto size = get_env("TOOLBRIDGE_MAX_FILE_SIZE"); !size.empty()) {
        auto parsed = parse_unsigned<std::uintmax_t>("TOOLBRIDGE_MAX_FILE_SIZE", size);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.sandbox.max_file_size = core::errors::get_value(parsed);
    }
    if (auto create = get_env("TOOLBRIDGE_CREATE_DIRECTORIES"); !create.empty()) {
        auto parsed = parse_bool("TOOLBRIDGE_CREATE_DIRECTORIES", create);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.sandbox.create_directories = core::errors::get_value(parsed);
    }
    if (const char* encodings = std::getenv("TOOLBRIDGE_FALLBACK_ENCODINGS");
        encodings != nullptr) {
        cfg.sandbox.fallback_encodings = split_csv(encodings);
    }

    if (auto max = get_env("TOOLBRIDGE_MAX_CONNECTIONS"); !max.empty()) {
        auto parsed = parse_unsigned<std::size_t>("TOOLBRIDGE_MAX_CONNECTIONS", max);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.connections.max_connections = core::errors::get_value(parsed);
    }
    if (auto interval = get_env("TOOLBRIDGE_HEARTBEAT_INTERVAL_SEC"); !interval.empty()) {
        auto parsed = parse_seconds("TOOLBRIDGE_HEARTBEAT_INTERVAL_SEC", interval);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.connections.heartbeat_interval = core::errors::get_value(parsed);
    }
    if (auto timeout = get_env("TOOLBRIDGE_HEARTBEAT_TIMEOUT_SEC"); !timeout.empty()) {
        auto parsed = parse_seconds("TOOLBRIDGE_HEARTBEAT_TIMEOUT_SEC", timeout);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.connections.heartbeat_timeout = core::errors::get_value(parsed);
    }
    if (auto liveness = get_env("TOOLBRIDGE_HEARTBEAT_LIVENESS"); !liveness.empty()) {
        const std::string v = lowercase(trim(liveness));
        if (v == "unanswered_ping") {
            cfg.connections.liveness = LivenessPolicy::UnansweredPing;
        } else if (v == "last_ping_window") {
            cfg.connections.liveness = LivenessPolicy::LastPingWindow;
        } else {
            return BridgeError{ErrorCategory::Input,
                               "Unknown heartbeat liveness policy: " + liveness,
                               codes::kInvalidConfig,
                               "Use unanswered_ping or last_ping_window."};
        }
    }
    if (auto enabled = get_env("TOOLBRIDGE_HEARTBEAT_ENABLED"); !enabled.empty()) {
        auto parsed = parse_bool("TOOLBRIDGE_HEARTBEAT_ENABLED", enabled);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.connections.heartbeat_enabled = core::errors::get_value(parsed);
    }

    if (const char* tools = std::getenv("TOOLBRIDGE_ENABLED_TOOLS"); tools != nullptr) {
        cfg.enabled_tools = split_csv(tools);
    }

    if (auto url = get_env("TOOLBRIDGE_DEVICE_URL"); !url.empty()) {
        auto parsed = parse_device_url(url, cfg.device);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.device = core::errors::get_value(parsed);
    }
    if (auto timeout = get_env("TOOLBRIDGE_DEVICE_TIMEOUT_SEC"); !timeout.empty()) {
        auto parsed = parse_seconds("TOOLBRIDGE_DEVICE_TIMEOUT_SEC", timeout);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        cfg.device.timeout = core::errors::get_value(parsed);
    }

    if (auto level = get_env("TOOLBRIDGE_LOG_LEVEL"); !level.empty()) {
        cfg.log_level = lowercase(trim(level));
    }

    return validate_config(std::move(cfg));
}

core::errors::Result<GatewayConfig> validate_config(GatewayConfig config) {
    if (config.listen.port == 0) {
        return BridgeError{ErrorCategory::Input, "Listen port must be between 1 and 65535.",
                           codes::kInvalidConfig};
    }
    if (config.listen.send_timeout.count() <= 0) {
        return BridgeError{ErrorCategory::Input, "send_timeout must be positive.",
                           codes::kInvalidConfig};
    }
    if (config.connections.max_connections == 0) {
        return BridgeError{ErrorCategory::Input, "max_connections must be greater than zero.",
                           codes::kInvalidConfig};
    }
    if (config.connections.heartbeat_interval.count() <= 0) {
        return BridgeError{ErrorCategory::Input, "heartbeat_interval must be positive.",
                           codes::kInvalidConfig};
    }
    if (config.connections.heartbeat_timeout.count() <= 0) {
        return BridgeError{ErrorCategory::Input, "heartbeat_timeout must be positive.",
                           codes::kInvalidConfig};
    }
    if (config.sandbox.max_file_size == 0) {
        return BridgeError{ErrorCategory::Input, "max_file_size must be greater than zero.",
                           codes::kInvalidConfig};
    }
    if (config.sandbox.base_directory.empty()) {
        return BridgeError{ErrorCategory::Input, "base_directory cannot be empty.",
                           codes::kInvalidConfig};
    }
    const std::string level = lowercase(config.log_level);
    if (level != "debug" && level != "info" && level != "warn" && level != "error") {
        return BridgeError{ErrorCategory::Input, "Unknown log level: " + config.log_level,
                           codes::kInvalidConfig, "Use debug, info, warn or error."};
    }
    config.log_level = level;
    config.sandbox.allowed_extensions = normalize_extensions(config.sandbox.allowed_extensions);
    return config;
}

}  // namespace toolbridge::core::config
