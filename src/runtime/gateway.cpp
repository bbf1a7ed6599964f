#include "runtime/gateway.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/message_contract.hpp"

namespace toolbridge::runtime {

using nlohmann::json;

namespace {

session::RegistryOptions registry_options(const core::config::GatewayConfig& config) {
    session::RegistryOptions options;
    options.max_connections = config.connections.max_connections;
    options.heartbeat_timeout = config.connections.heartbeat_timeout;
    options.liveness = config.connections.liveness;
    options.server_name = kServerName;
    options.server_version = kServerVersion;
    return options;
}

}  // namespace

Gateway::Gateway(core::config::GatewayConfig config,
                 std::shared_ptr<device::CommandForwarder> forwarder,
                 std::shared_ptr<ChatCollaborator> chat, session::SteadyClock clock)
    : config_(std::move(config)),
      connections_(registry_options(config_), std::move(clock)),
      heartbeat_(connections_, config_.connections.heartbeat_interval),
      router_(connections_, tools_, std::move(chat)) {
    file_tools_ = std::make_shared<const tools::FileTools>(config_.sandbox);
    tools::register_file_tools(tools_, file_tools_, config_.enabled_tools);

    if (!forwarder && config_.device.enabled) {
        forwarder = std::make_shared<device::HttpDeviceBridge>(config_.device);
    }
    if (forwarder) {
        device_tools_ = std::make_shared<const tools::DeviceTools>(std::move(forwarder));
        tools::register_device_tools(tools_, device_tools_, config_.enabled_tools);
    }

    LOG_INFO("Gateway: " + std::to_string(tools_.list().size()) + " tool(s) enabled, sandbox " +
             config_.sandbox.base_directory.string());
}

Gateway::~Gateway() {
    shutdown();
}

void Gateway::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_ || shut_down_) {
        return;
    }
    started_ = true;
    if (config_.connections.heartbeat_enabled) {
        heartbeat_.start();
    } else {
        LOG_WARN("Gateway: heartbeat disabled, dead peers are only detected on send");
    }
}

void Gateway::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    LOG_INFO("Gateway: shutting down");
    heartbeat_.stop();
    connections_.shutdown();
}

json Gateway::server_info() const {
    json names = json::array();
    for (const auto& name : tools_.enabled_names()) {
        names.push_back(name);
    }
    json info;
    info["name"] = kServerName;
    info["version"] = kServerVersion;
    info["description"] = "Tool gateway over HTTP and WebSocket";
    info["capabilities"] = json{{"tools", true},
                                {"file_operations", true},
                                {"chat", router_.chat_available()},
                                {"websocket", true},
                                {"device", device_tools_ != nullptr}};
    info["tools"] = std::move(names);
    return info;
}

json Gateway::health() const {
    json status;
    status["status"] = "healthy";
    status["timestamp"] = protocol::unix_timestamp_now();
    status["chat_available"] = router_.chat_available();
    status["websocket_connections"] = connections_.size();
    return status;
}

}  // namespace toolbridge::runtime
