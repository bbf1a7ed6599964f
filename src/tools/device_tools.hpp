#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "device/device_bridge.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::tools {

class ToolRegistry;

// Eisenhower classification; importance and urgency of 3 or more count as high.
std::string eisenhower_quadrant(int importance, int urgency);

// Pomodoro and task commands forwarded to the paired device.
class DeviceTools {
public:
    explicit DeviceTools(std::shared_ptr<device::CommandForwarder> forwarder);

    core::errors::Result<nlohmann::json> start_pomodoro(const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> control_pomodoro(const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> manage_break(const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> manage_tasks(const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> get_statistics(const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> update_settings(const nlohmann::json& arguments) const;
    core::errors::Result<nlohmann::json> check_device_status(const nlohmann::json& arguments) const;

    static std::vector<protocol::ToolDescriptor> descriptors();

private:
    // Forwards and maps an unsuccessful reply to device_command_failed.
    core::errors::Result<nlohmann::json> forward(const std::string& command,
                                                 const nlohmann::json& args,
                                                 const std::string& success_message) const;

    std::shared_ptr<device::CommandForwarder> forwarder_;
};

void register_device_tools(ToolRegistry& registry, std::shared_ptr<const DeviceTools> device_tools,
                           const std::vector<std::string>& enabled_tools);

}  // namespace toolbridge::tools
