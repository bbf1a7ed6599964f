#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/config/gateway_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::device {

inline constexpr const char* kCommandPath = "/api/command/execute";

struct DeviceReply {
    bool success = false;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
};

// Delivers a named command to the paired device.
class CommandForwarder {
public:
    virtual ~CommandForwarder() = default;

    // Fails with device_unreachable when the device cannot be reached. A reply
    // the device marks unsuccessful is still a value.
    virtual core::errors::Result<DeviceReply> forward(const std::string& command,
                                                      const nlohmann::json& args) = 0;
};

// {command, args, timestamp} as posted to the device.
nlohmann::json build_command_payload(const std::string& command, const nlohmann::json& args,
                                     long long timestamp);

core::errors::Result<DeviceReply> parse_device_reply(unsigned status, const std::string& body);

class HttpDeviceBridge : public CommandForwarder {
public:
    explicit HttpDeviceBridge(core::config::DeviceConfig config);

    core::errors::Result<DeviceReply> forward(const std::string& command,
                                              const nlohmann::json& args) override;

    std::string endpoint() const;

private:
    core::config::DeviceConfig config_;
};

}  // namespace toolbridge::device
