#include "tools/device_tools.hpp"

#include <algorithm>
#include <functional>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/tool_registry.hpp"

namespace toolbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

const std::vector<std::string> kSettingKeys = {"dark_mode",      "tomato_duration",
                                               "break_duration", "notification_enabled",
                                               "auto_start_break", "sound_enabled"};

json optional_field(const json& arguments, const std::string& key) {
    const auto it = arguments.find(key);
    return it == arguments.end() ? json(nullptr) : *it;
}

BridgeError missing(const std::string& message) {
    return BridgeError{ErrorCategory::Input, message, codes::kMissingArgument};
}

core::errors::Result<json> validate_task_data(const json& task_data) {
    if (!task_data.is_object()) {
        return BridgeError{ErrorCategory::Input, "task_data must be an object",
                           codes::kInvalidArgument};
    }
    const auto name_it = task_data.find("name");
    if (name_it == task_data.end() || !name_it->is_string() ||
        name_it->get<std::string>().empty()) {
        return missing("task_data.name is required");
    }
    for (const char* level : {"importance", "urgency"}) {
        const auto it = task_data.find(level);
        if (it == task_data.end()) {
            return missing(std::string("task_data.") + level + " is required");
        }
        if (!it->is_number_integer() || it->get<int>() < 1 || it->get<int>() > 4) {
            return BridgeError{ErrorCategory::Input,
                               std::string("task_data.") + level +
                                   " must be an integer between 1 and 4",
                               codes::kInvalidArgument};
        }
    }
    json validated = task_data;
    if (!validated.contains("status")) {
        validated["status"] = "pending";
    }
    return validated;
}

}  // namespace

std::string eisenhower_quadrant(const int importance, const int urgency) {
    const bool important = importance >= 3;
    const bool urgent = urgency >= 3;
    if (important && urgent) return "Q1: important and urgent";
    if (important) return "Q2: important, not urgent";
    if (urgent) return "Q3: urgent, not important";
    return "Q4: neither important nor urgent";
}

DeviceTools::DeviceTools(std::shared_ptr<device::CommandForwarder> forwarder)
    : forwarder_(std::move(forwarder)) {}

core::errors::Result<json> DeviceTools::forward(const std::string& command, const json& args,
                                                const std::string& success_message) const {
    auto reply = forwarder_->forward(command, args);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& value = core::errors::get_value(reply);
    if (!value.success) {
        return BridgeError{ErrorCategory::Execution,
                           value.message.empty() ? "Device rejected command " + command
                                                 : value.message,
                           codes::kDeviceCommandFailed};
    }

    json payload;
    payload["message"] = success_message;
    payload["data"] = value.data;
    return payload;
}

core::errors::Result<json> DeviceTools::start_pomodoro(const json& arguments) const {
    const auto task_name = arguments.at("task_name").get<std::string>();
    if (task_name.empty()) {
        return missing("task_name must not be empty");
    }
    const int duration = arguments.value("duration", 25);

    json args;
    args["task_name"] = task_name;
    args["duration"] = duration;
    args["task_id"] = optional_field(arguments, "task_id");
    return forward("start_pomodoro", args,
                   "Pomodoro started for '" + task_name + "' (" + std::to_string(duration) +
                       " minutes)");
}

core::errors::Result<json> DeviceTools::control_pomodoro(const json& arguments) const {
    const auto action = arguments.at("action").get<std::string>();
    json args;
    args["action"] = action;
    args["reason"] = optional_field(arguments, "reason");

    std::string message = "Pomodoro " + action + " succeeded";
    if (arguments.contains("reason") && arguments["reason"].is_string()) {
        message += " (reason: " + arguments["reason"].get<std::string>() + ")";
    }
    return forward("control_pomodoro", args, message);
}

core::errors::Result<json> DeviceTools::manage_break(const json& arguments) const {
    const auto action = arguments.at("action").get<std::string>();
    json args;
    args["action"] = action;
    return forward("manage_break", args,
                   action == "start" ? "Break started" : "Break skipped");
}

core::errors::Result<json> DeviceTools::manage_tasks(const json& arguments) const {
    const auto action = arguments.at("action").get<std::string>();
    json task_data = optional_field(arguments, "task_data");
    const json task_id = optional_field(arguments, "task_id");

    if ((action == "create" || action == "update") && task_data.is_null()) {
        return missing("task_data is required to " + action + " a task");
    }
    if ((action == "update" || action == "delete" || action == "complete") &&
        (task_id.is_null() || (task_id.is_string() && task_id.get<std::string>().empty()))) {
        return missing("task_id is required to " + action + " a task");
    }
    if (!task_data.is_null()) {
        auto validated = validate_task_data(task_data);
        if (core::errors::is_error(validated)) {
            return core::errors::get_error(validated);
        }
        task_data = core::errors::get_value(validated);
    }

    json args;
    args["action"] = action;
    args["task_data"] = task_data;
    args["task_id"] = task_id;

    std::string message = "Task " + action + " succeeded";
    auto outcome = forward("manage_tasks", args, message);
    if (core::errors::is_error(outcome) || action != "create") {
        return outcome;
    }

    json payload = core::errors::get_value(outcome);
    const std::string quadrant = eisenhower_quadrant(task_data.value("importance", 1),
                                                     task_data.value("urgency", 1));
    payload["quadrant"] = quadrant;
    payload["message"] = message + ", classified as " + quadrant;
    return payload;
}

core::errors::Result<json> DeviceTools::get_statistics(const json& arguments) const {
    const auto type = arguments.at("type").get<std::string>();
    json args;
    args["type"] = type;
    args["period"] = optional_field(arguments, "period");
    args["filters"] = optional_field(arguments, "filters");
    return forward("get_statistics", args, "Fetched " + type + " statistics");
}

core::errors::Result<json> DeviceTools::update_settings(const json& arguments) const {
    json settings = json::object();
    for (const auto& key : kSettingKeys) {
        const auto it = arguments.find(key);
        if (it != arguments.end() && !it->is_null()) {
            settings[key] = *it;
        }
    }
    if (settings.empty()) {
        return missing("Provide at least one setting to update");
    }
    return forward("update_settings", settings,
                   "Updated " + std::to_string(settings.size()) + " setting(s)");
}

core::errors::Result<json> DeviceTools::check_device_status(const json&) const {
    auto status = forward("check_status", json::object(), "Device is connected");
    if (core::errors::is_error(status)) {
        return status;
    }

    bool connection_ok = false;
    auto ping = forwarder_->forward("ping", json::object());
    if (!core::errors::is_error(ping)) {
        connection_ok = core::errors::get_value(ping).success;
    }

    json payload = core::errors::get_value(status);
    if (!payload["data"].is_object()) {
        payload["data"] = json::object();
    }
    payload["data"]["connection_test"] = connection_ok;
    return payload;
}

std::vector<protocol::ToolDescriptor> DeviceTools::descriptors() {
    std::vector<protocol::ToolDescriptor> descriptors;

    protocol::ToolDescriptor start;
    start.name = "start_pomodoro";
    start.description = "Start a pomodoro focus timer on the device";
    start.parameters = json{
        {"type", "object"},
        {"properties",
         {{"task_name", {{"type", "string"}, {"description", "Task to focus on"}}},
          {"duration",
           {{"type", "integer"},
            {"description", "Length in minutes"},
            {"default", 25},
            {"minimum", 5},
            {"maximum", 60}}},
          {"task_id", {{"type", "string"}, {"description", "Linked task id"}}}}},
        {"required", json::array({"task_name"})}};
    start.synonyms = {{"task_name", {"task", "name"}}};
    descriptors.push_back(std::move(start));

    protocol::ToolDescriptor control;
    control.name = "control_pomodoro";
    control.description = "Pause, resume, stop or query the running pomodoro";
    control.parameters = json{
        {"type", "object"},
        {"properties",
         {{"action",
           {{"type", "string"}, {"enum", json::array({"pause", "resume", "stop", "status"})}}},
          {"reason", {{"type", "string"}}}}},
        {"required", json::array({"action"})}};
    descriptors.push_back(std::move(control));

    protocol::ToolDescriptor rest;
    rest.name = "manage_break";
    rest.description = "Start or skip a break";
    rest.parameters = json{
        {"type", "object"},
        {"properties",
         {{"action", {{"type", "string"}, {"enum", json::array({"start", "skip"})}}}}},
        {"required", json::array({"action"})}};
    descriptors.push_back(std::move(rest));

    protocol::ToolDescriptor tasks;
    tasks.name = "manage_tasks";
    tasks.description = "Create, update, delete, list or complete Eisenhower matrix tasks";
    tasks.parameters = json{
        {"type", "object"},
        {"properties",
         {{"action",
           {{"type", "string"},
            {"enum", json::array({"create", "update", "delete", "list", "complete"})}}},
          {"task_data",
           {{"type", "object"},
            {"properties",
             {{"name", {{"type", "string"}}},
              {"description", {{"type", "string"}}},
              {"importance", {{"type", "integer"}, {"minimum", 1}, {"maximum", 4}}},
              {"urgency", {{"type", "integer"}, {"minimum", 1}, {"maximum", 4}}},
              {"due_date", {{"type", "string"}}},
              {"estimated_pomodoros", {{"type", "integer"}}}}}}},
          {"task_id", {{"type", "string"}}}}},
        {"required", json::array({"action"})}};
    descriptors.push_back(std::move(tasks));

    protocol::ToolDescriptor statistics;
    statistics.name = "get_statistics";
    statistics.description = "Fetch pomodoro and task statistics";
    statistics.parameters = json{
        {"type", "object"},
        {"properties",
         {{"type",
           {{"type", "string"},
            {"enum",
             json::array({"general", "daily", "weekly", "monthly", "pomodoro", "tasks"})}}},
          {"period", {{"type", "string"}}},
          {"filters", {{"type", "object"}}}}},
        {"required", json::array({"type"})}};
    descriptors.push_back(std::move(statistics));

    protocol::ToolDescriptor settings;
    settings.name = "update_settings";
    settings.description = "Update device preferences";
    settings.parameters = json{
        {"type", "object"},
        {"properties",
         {{"dark_mode", {{"type", "boolean"}}},
          {"tomato_duration", {{"type", "integer"}}},
          {"break_duration", {{"type", "integer"}}},
          {"notification_enabled", {{"type", "boolean"}}},
          {"auto_start_break", {{"type", "boolean"}}},
          {"sound_enabled", {{"type", "boolean"}}}}}};
    descriptors.push_back(std::move(settings));

    protocol::ToolDescriptor status;
    status.name = "check_android_status";
    status.description = "Check that the device is reachable and its features are available";
    status.parameters = json{{"type", "object"}, {"properties", json::object()}};
    descriptors.push_back(std::move(status));

    return descriptors;
}

void register_device_tools(ToolRegistry& registry, std::shared_ptr<const DeviceTools> device_tools,
                           const std::vector<std::string>& enabled_tools) {
    using Method = core::errors::Result<json> (DeviceTools::*)(const json&) const;
    const std::vector<std::pair<std::string, Method>> methods = {
        {"start_pomodoro", &DeviceTools::start_pomodoro},
        {"control_pomodoro", &DeviceTools::control_pomodoro},
        {"manage_break", &DeviceTools::manage_break},
        {"manage_tasks", &DeviceTools::manage_tasks},
        {"get_statistics", &DeviceTools::get_statistics},
        {"update_settings", &DeviceTools::update_settings},
        {"check_android_status", &DeviceTools::check_device_status}};

    for (auto& descriptor : DeviceTools::descriptors()) {
        const auto method_it =
            std::find_if(methods.begin(), methods.end(),
                         [&](const auto& entry) { return entry.first == descriptor.name; });
        if (method_it == methods.end()) {
            continue;
        }
        const Method method = method_it->second;
        descriptor.enabled = std::find(enabled_tools.begin(), enabled_tools.end(),
                                       descriptor.name) != enabled_tools.end();
        registry.register_tool(std::move(descriptor),
                               [device_tools, method](const json& arguments) {
                                   return ((*device_tools).*method)(arguments);
                               });
    }
    LOG_INFO("Device tools registered");
}

}  // namespace toolbridge::tools
