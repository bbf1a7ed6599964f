#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/gateway_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::tools {

class ToolRegistry;

// Sandboxed filesystem operations behind read_file, write_file and list_files.
class FileTools {
public:
    explicit FileTools(core::config::SandboxConfig config);

    // {file_path} -> {path, content, size, encoding?}
    core::errors::Result<nlohmann::json> read_file(const nlohmann::json& arguments) const;

    // {file_path, content} -> {path, bytes_written, created_directories, message}
    core::errors::Result<nlohmann::json> write_file(const nlohmann::json& arguments) const;

    // {directory_path} -> {path, entries, total_files, total_dirs, empty}
    core::errors::Result<nlohmann::json> list_files(const nlohmann::json& arguments) const;

    const core::config::SandboxConfig& config() const { return config_; }

    static protocol::ToolDescriptor read_file_descriptor();
    static protocol::ToolDescriptor write_file_descriptor();
    static protocol::ToolDescriptor list_files_descriptor();

private:
    core::config::SandboxConfig config_;
    policy::PolicyGuard policy_guard_;
};

// Registers the three file tools; names missing from `enabled_tools` are
// registered disabled.
void register_file_tools(ToolRegistry& registry, std::shared_ptr<const FileTools> file_tools,
                         const std::vector<std::string>& enabled_tools);

}  // namespace toolbridge::tools
