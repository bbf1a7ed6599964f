#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::core::config {

enum class LivenessPolicy {
    UnansweredPing,
    LastPingWindow
};

struct ListenConfig {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8000;
    // A WebSocket write that has not completed by then fails and evicts the peer.
    std::chrono::milliseconds send_timeout{5000};
};

struct SandboxConfig {
    std::filesystem::path base_directory = ".";
    std::vector<std::string> allowed_extensions = {".txt", ".json", ".csv", ".md", ".py"};
    std::uintmax_t max_file_size = 10485760;
    bool create_directories = true;
    std::vector<std::string> fallback_encodings = {"GBK", "ISO-8859-1"};
};

struct ConnectionConfig {
    std::size_t max_connections = 100;
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds heartbeat_timeout{60000};
    LivenessPolicy liveness = LivenessPolicy::UnansweredPing;
    bool heartbeat_enabled = true;
};

struct DeviceConfig {
    bool enabled = false;
    std::string host = "192.168.1.100";
    std::uint16_t port = 8080;
    std::chrono::milliseconds timeout{10000};
};

struct GatewayConfig {
    ListenConfig listen;
    SandboxConfig sandbox;
    ConnectionConfig connections;
    DeviceConfig device;
    std::vector<std::string> enabled_tools = {
        "read_file",      "write_file",      "list_files",
        "start_pomodoro", "control_pomodoro", "manage_break",
        "manage_tasks",   "get_statistics",   "update_settings",
        "check_android_status"};
    std::string log_level = "info";
};

// Overlays TOOLBRIDGE_* environment variables on top of `base`.
core::errors::Result<GatewayConfig> load_config_from_env(GatewayConfig base = {});

core::errors::Result<GatewayConfig> validate_config(GatewayConfig config);

// Parses "http://host:port", "host:port" or "host" into the device endpoint.
core::errors::Result<DeviceConfig> parse_device_url(const std::string& url,
                                                     DeviceConfig base = {});

bool is_tool_enabled(const GatewayConfig& config, const std::string& tool_name);

std::string to_string(LivenessPolicy policy);

}  // namespace toolbridge::core::config
