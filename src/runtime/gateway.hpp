#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "core/config/gateway_config.hpp"
#include "device/device_bridge.hpp"
#include "runtime/message_router.hpp"
#include "session/connection_registry.hpp"
#include "session/heartbeat_monitor.hpp"
#include "tools/device_tools.hpp"
#include "tools/file_tools.hpp"
#include "tools/tool_registry.hpp"

namespace toolbridge::runtime {

inline constexpr const char* kServerName = "toolbridge";
inline constexpr const char* kServerVersion = "1.0.0";

// Owns and wires every long-lived component for one server instance.
class Gateway {
public:
    // A null forwarder with a configured device endpoint gets an HttpDeviceBridge.
    explicit Gateway(core::config::GatewayConfig config,
                     std::shared_ptr<device::CommandForwarder> forwarder = nullptr,
                     std::shared_ptr<ChatCollaborator> chat = nullptr,
                     session::SteadyClock clock = nullptr);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    void start();
    // Stops the heartbeat thread, then closes every connection. Idempotent.
    void shutdown();

    tools::ToolRegistry& tools() { return tools_; }
    session::ConnectionRegistry& connections() { return connections_; }
    session::HeartbeatMonitor& heartbeat() { return heartbeat_; }
    MessageRouter& router() { return router_; }
    const core::config::GatewayConfig& config() const { return config_; }
    bool device_tools_registered() const { return device_tools_ != nullptr; }

    nlohmann::json server_info() const;
    nlohmann::json health() const;

private:
    const core::config::GatewayConfig config_;
    tools::ToolRegistry tools_;
    session::ConnectionRegistry connections_;
    session::HeartbeatMonitor heartbeat_;
    MessageRouter router_;
    std::shared_ptr<const tools::FileTools> file_tools_;
    std::shared_ptr<const tools::DeviceTools> device_tools_;

    std::mutex lifecycle_mutex_;
    bool started_ = false;
    bool shut_down_ = false;
};

}  // namespace toolbridge::runtime
