#include "tools/tool_registry.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include "core/logging/logger.hpp"
#include "protocol/message_contract.hpp"
#include "tools/argument_schema.hpp"

namespace toolbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using protocol::ToolCallResult;
using protocol::ToolStats;
namespace codes = core::errors::codes;

namespace {

ToolCallResult failure(const BridgeError& error, const double duration_ms) {
    ToolCallResult result;
    result.success = false;
    result.result = nullptr;
    result.error = error.message;
    result.error_code = error.code;
    result.duration_ms = duration_ms;
    return result;
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

}  // namespace

void ToolRegistry::register_tool(protocol::ToolDescriptor descriptor, ToolHandler handler) {
    auto entry = std::make_shared<ToolEntry>();
    const std::string name = descriptor.name;
    entry->descriptor = std::move(descriptor);
    entry->handler = std::move(handler);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const bool replaced = tools_.find(name) != tools_.end();
    tools_[name] = std::move(entry);
    if (!replaced) {
        order_.push_back(name);
    }
    lock.unlock();

    if (replaced) {
        LOG_INFO("Replaced tool: " + name);
    } else {
        LOG_DEBUG("Registered tool: " + name);
    }
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (tools_.erase(name) == 0) {
        lock.unlock();
        LOG_WARN("Cannot unregister unknown tool: " + name);
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    lock.unlock();
    LOG_INFO("Unregistered tool: " + name);
    return true;
}

bool ToolRegistry::set_enabled(const std::string& name, const bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        lock.unlock();
        LOG_WARN("Cannot toggle unknown tool: " + name);
        return false;
    }
    it->second->descriptor.enabled = enabled;
    return true;
}

std::vector<protocol::ToolDescriptor> ToolRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<protocol::ToolDescriptor> catalog;
    catalog.reserve(order_.size());
    for (const auto& name : order_) {
        const auto& entry = tools_.at(name);
        if (entry->descriptor.enabled) {
            catalog.push_back(entry->descriptor);
        }
    }
    return catalog;
}

std::vector<std::string> ToolRegistry::enabled_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& name : order_) {
        if (tools_.at(name)->descriptor.enabled) {
            names.push_back(name);
        }
    }
    return names;
}

bool ToolRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.find(name) != tools_.end();
}

std::size_t ToolRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tools_.size();
}

std::shared_ptr<ToolRegistry::ToolEntry> ToolRegistry::find_enabled(
    const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = tools_.find(name);
    if (it == tools_.end() || !it->second->descriptor.enabled) {
        return nullptr;
    }
    return it->second;
}

ToolCallResult ToolRegistry::unknown_tool_result(const std::string& name) const {
    std::string available;
    for (const auto& tool_name : enabled_names()) {
        if (!available.empty()) {
            available += ", ";
        }
        available += tool_name;
    }
    return failure(BridgeError{ErrorCategory::Input,
                               "Unknown tool: " + name + ". Available tools: " +
                                   (available.empty() ? std::string("(none)") : available),
                               codes::kUnknownTool},
                   0.0);
}

void ToolRegistry::record_outcome(ToolEntry& entry, const bool success) {
    std::lock_guard<std::mutex> lock(entry.stats_mutex);
    if (success) {
        ++entry.stats.success_count;
    } else {
        ++entry.stats.error_count;
    }
    entry.stats.last_used = protocol::unix_timestamp_now();
}

ToolCallResult ToolRegistry::invoke(const std::string& name, const nlohmann::json& arguments) {
    // Holding the entry keeps it alive even if it is replaced mid-call.
    const auto entry = find_enabled(name);
    if (!entry) {
        LOG_WARN("Call to unknown tool: " + name);
        return unknown_tool_result(name);
    }

    protocol::ToolInvocation invocation;
    invocation.tool_name = name;
    invocation.started = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(entry->stats_mutex);
        ++entry->stats.call_count;
    }

    invocation.arguments = normalize_arguments(arguments, entry->descriptor.synonyms);
    auto validated = validate_arguments(invocation.arguments, entry->descriptor.parameters);
    if (core::errors::is_error(validated)) {
        record_outcome(*entry, false);
        const auto& error = core::errors::get_error(validated);
        LOG_WARN("Tool " + name + " rejected arguments: " + error.message);
        return failure(error, elapsed_ms(invocation.started));
    }

    core::errors::Result<nlohmann::json> outcome =
        BridgeError{ErrorCategory::Internal, "Tool produced no result", codes::kHandlerException};
    try {
        outcome = entry->handler(core::errors::get_value(validated));
    } catch (const std::exception& e) {
        outcome = BridgeError{ErrorCategory::Execution,
                              "Tool " + name + " raised an exception: " + e.what(),
                              codes::kHandlerException};
    } catch (...) {
        outcome = BridgeError{ErrorCategory::Execution,
                              "Tool " + name + " raised a non-standard exception",
                              codes::kHandlerException};
    }

    invocation.duration_ms = elapsed_ms(invocation.started);
    invocation.success = !core::errors::is_error(outcome);
    record_outcome(*entry, invocation.success);

    if (!invocation.success) {
        const auto& error = core::errors::get_error(outcome);
        invocation.error_message = error.message;
        LOG_WARN("Tool " + name + " failed after " + std::to_string(invocation.duration_ms) +
                 "ms: " + error.message);
        return failure(error, invocation.duration_ms);
    }

    LOG_INFO("Tool " + name + " succeeded in " + std::to_string(invocation.duration_ms) + "ms");
    ToolCallResult result;
    result.success = true;
    result.result = core::errors::get_value(outcome);
    result.duration_ms = invocation.duration_ms;
    return result;
}

core::errors::Result<ToolStats> ToolRegistry::stats(const std::string& name) const {
    std::shared_ptr<ToolEntry> entry;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto it = tools_.find(name);
        if (it != tools_.end()) {
            entry = it->second;
        }
    }
    if (!entry) {
        return BridgeError{ErrorCategory::Input, "Unknown tool: " + name, codes::kUnknownTool};
    }
    std::lock_guard<std::mutex> lock(entry->stats_mutex);
    return entry->stats;
}

std::vector<std::pair<std::string, ToolStats>> ToolRegistry::all_stats() const {
    std::vector<std::pair<std::string, std::shared_ptr<ToolEntry>>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& name : order_) {
            entries.emplace_back(name, tools_.at(name));
        }
    }

    std::vector<std::pair<std::string, ToolStats>> snapshot;
    snapshot.reserve(entries.size());
    for (const auto& [name, entry] : entries) {
        std::lock_guard<std::mutex> lock(entry->stats_mutex);
        snapshot.emplace_back(name, entry->stats);
    }
    return snapshot;
}

void ToolRegistry::reset_stats() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [name, entry] : tools_) {
        std::lock_guard<std::mutex> stats_lock(entry->stats_mutex);
        entry->stats = ToolStats{};
    }
    LOG_INFO("Tool statistics reset");
}

}  // namespace toolbridge::tools
