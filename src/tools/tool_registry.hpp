#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::tools {

// Receives normalized, schema-validated arguments.
using ToolHandler = std::function<core::errors::Result<nlohmann::json>(const nlohmann::json&)>;

class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Last write wins. A replaced tool keeps its catalog position and its
    // statistics restart from zero.
    void register_tool(protocol::ToolDescriptor descriptor, ToolHandler handler);

    bool unregister_tool(const std::string& name);
    bool set_enabled(const std::string& name, bool enabled);

    // Enabled descriptors in insertion order.
    std::vector<protocol::ToolDescriptor> list() const;
    std::vector<std::string> enabled_names() const;
    bool contains(const std::string& name) const;
    std::size_t size() const;

    // Never throws; every failure comes back as success=false.
    protocol::ToolCallResult invoke(const std::string& name, const nlohmann::json& arguments);

    core::errors::Result<protocol::ToolStats> stats(const std::string& name) const;
    std::vector<std::pair<std::string, protocol::ToolStats>> all_stats() const;
    void reset_stats();

private:
    struct ToolEntry {
        protocol::ToolDescriptor descriptor;
        ToolHandler handler;
        mutable std::mutex stats_mutex;
        protocol::ToolStats stats;
    };

    std::shared_ptr<ToolEntry> find_enabled(const std::string& name) const;
    protocol::ToolCallResult unknown_tool_result(const std::string& name) const;
    static void record_outcome(ToolEntry& entry, bool success);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ToolEntry>> tools_;
    std::vector<std::string> order_;
};

}  // namespace toolbridge::tools
