#include "tools/file_tools.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/text_decoding.hpp"
#include "tools/tool_registry.hpp"

namespace toolbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

policy::SandboxPolicy to_sandbox_policy(const core::config::SandboxConfig& config) {
    policy::SandboxPolicy sandbox_policy;
    sandbox_policy.base_directory = config.base_directory;
    sandbox_policy.allowed_extensions = config.allowed_extensions;
    return sandbox_policy;
}

BridgeError too_large(const std::filesystem::path& path, const std::uintmax_t size,
                      const std::uintmax_t limit) {
    return BridgeError{ErrorCategory::Input,
                       "File too large: " + path.string() + " is " + std::to_string(size) +
                           " bytes (limit " + std::to_string(limit) + " bytes)",
                       codes::kTooLarge};
}

bool has_tool(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

FileTools::FileTools(core::config::SandboxConfig config)
    : config_(std::move(config)), policy_guard_(to_sandbox_policy(config_)) {}

core::errors::Result<json> FileTools::read_file(const json& arguments) const {
    const std::filesystem::path requested = arguments.at("file_path").get<std::string>();
    auto resolved = policy_guard_.validate_path_in_sandbox(requested);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return BridgeError{ErrorCategory::Input, "File does not exist: " + file_path.string(),
                           codes::kNotFound};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return BridgeError{ErrorCategory::Input,
                           "Path is not a regular file: " + file_path.string(),
                           codes::kWrongType};
    }

    const std::uintmax_t size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Execution,
                           "Unable to stat file: " + file_path.string(), codes::kIoFailure};
    }
    if (size > config_.max_file_size) {
        return too_large(file_path, size, config_.max_file_size);
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return BridgeError{ErrorCategory::Execution,
                           "Failed to open file: " + file_path.string(), codes::kIoFailure};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return BridgeError{ErrorCategory::Execution,
                           "I/O error while reading file: " + file_path.string(),
                           codes::kIoFailure};
    }
    const std::string bytes = buffer.str();

    auto decoded = decode_text(bytes, config_.fallback_encodings);
    if (core::errors::is_error(decoded)) {
        const auto& error = core::errors::get_error(decoded);
        return BridgeError{error.category, error.message + ": " + file_path.string(),
                           error.code};
    }
    const auto& text = core::errors::get_value(decoded);

    json payload;
    payload["path"] = file_path.string();
    payload["content"] = text.text;
    payload["size"] = bytes.size();
    if (text.encoding != kPrimaryEncoding) {
        payload["encoding"] = text.encoding;
        LOG_INFO("Read " + file_path.string() + " using fallback encoding " + text.encoding);
    }
    return payload;
}

core::errors::Result<json> FileTools::write_file(const json& arguments) const {
    const std::filesystem::path requested = arguments.at("file_path").get<std::string>();
    const std::string content = arguments.at("content").get<std::string>();

    auto resolved = policy_guard_.validate_path_in_sandbox(requested);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    auto extension = policy_guard_.validate_write_extension(file_path);
    if (core::errors::is_error(extension)) {
        return core::errors::get_error(extension);
    }
    if (content.size() > config_.max_file_size) {
        return too_large(file_path, content.size(), config_.max_file_size);
    }

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return BridgeError{ErrorCategory::Input,
                           "Path is a directory: " + file_path.string(), codes::kWrongType};
    }

    bool created_directories = false;
    const std::filesystem::path parent = file_path.parent_path();
    if (!std::filesystem::exists(parent, ec)) {
        if (!config_.create_directories) {
            return BridgeError{ErrorCategory::Input,
                               "Directory does not exist: " + parent.string(),
                               codes::kNotFound,
                               "Enable directory creation or create the directory first"};
        }
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return BridgeError{ErrorCategory::Execution,
                               "Failed to create directory " + parent.string() + ": " +
                                   ec.message(),
                               codes::kIoFailure};
        }
        created_directories = true;
    } else if (!std::filesystem::is_directory(parent, ec)) {
        return BridgeError{ErrorCategory::Input,
                           "Parent path is not a directory: " + parent.string(),
                           codes::kWrongType};
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return BridgeError{ErrorCategory::Execution,
                           "Failed to open file for writing: " + file_path.string(),
                           codes::kIoFailure};
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (out.fail()) {
        return BridgeError{ErrorCategory::Execution,
                           "I/O error while writing file: " + file_path.string(),
                           codes::kIoFailure};
    }

    json payload;
    payload["path"] = file_path.string();
    payload["bytes_written"] = content.size();
    payload["created_directories"] = created_directories;
    payload["message"] = "Wrote " + std::to_string(content.size()) + " bytes to " +
                         file_path.string();
    return payload;
}

core::errors::Result<json> FileTools::list_files(const json& arguments) const {
    const std::filesystem::path requested = arguments.value("directory_path", std::string("."));
    auto resolved = policy_guard_.validate_path_in_sandbox(requested);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path directory = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(directory, ec) || ec) {
        return BridgeError{ErrorCategory::Input,
                           "Directory does not exist: " + directory.string(),
                           codes::kNotFound};
    }
    if (!std::filesystem::is_directory(directory, ec) || ec) {
        return BridgeError{ErrorCategory::Input, "Path is not a directory: " + directory.string(),
                           codes::kWrongType};
    }

    std::vector<std::filesystem::directory_entry> children;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Execution,
                           "Failed to list directory " + directory.string() + ": " + ec.message(),
                           codes::kIoFailure};
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return BridgeError{ErrorCategory::Execution,
                               "Failed to list directory " + directory.string() + ": " +
                                   ec.message(),
                               codes::kIoFailure};
        }
        children.push_back(*it);
    }
    std::sort(children.begin(), children.end(),
              [](const auto& lhs, const auto& rhs) {
                  return lhs.path().filename() < rhs.path().filename();
              });

    json entries = json::array();
    std::size_t total_files = 0;
    std::size_t total_dirs = 0;
    for (const auto& child : children) {
        json entry;
        entry["name"] = child.path().filename().string();
        std::error_code entry_ec;
        if (child.is_regular_file(entry_ec)) {
            entry["type"] = "file";
            const auto size = child.file_size(entry_ec);
            if (!entry_ec) {
                entry["size"] = size;
            }
            ++total_files;
        } else if (child.is_directory(entry_ec)) {
            entry["type"] = "directory";
            ++total_dirs;
        } else {
            entry["type"] = "other";
        }
        entries.push_back(std::move(entry));
    }

    json payload;
    payload["path"] = directory.string();
    payload["entries"] = std::move(entries);
    payload["total_files"] = total_files;
    payload["total_dirs"] = total_dirs;
    payload["empty"] = children.empty();
    return payload;
}

protocol::ToolDescriptor FileTools::read_file_descriptor() {
    protocol::ToolDescriptor descriptor;
    descriptor.name = "read_file";
    descriptor.description = "Read a text file inside the sandbox directory";
    descriptor.parameters = json{
        {"type", "object"},
        {"properties",
         {{"file_path", {{"type", "string"}, {"description", "Path of the file to read"}}}}},
        {"required", json::array({"file_path"})}};
    descriptor.synonyms = {{"file_path", {"path", "filepath", "file", "filename"}}};
    return descriptor;
}

protocol::ToolDescriptor FileTools::write_file_descriptor() {
    protocol::ToolDescriptor descriptor;
    descriptor.name = "write_file";
    descriptor.description = "Write text content to a file inside the sandbox directory";
    descriptor.parameters = json{
        {"type", "object"},
        {"properties",
         {{"file_path", {{"type", "string"}, {"description", "Path of the file to write"}}},
          {"content", {{"type", "string"}, {"description", "Text to write"}}}}},
        {"required", json::array({"file_path", "content"})}};
    descriptor.synonyms = {{"file_path", {"path", "filepath", "file", "filename"}},
                           {"content", {"text", "data"}}};
    return descriptor;
}

protocol::ToolDescriptor FileTools::list_files_descriptor() {
    protocol::ToolDescriptor descriptor;
    descriptor.name = "list_files";
    descriptor.description = "List the entries of a directory inside the sandbox directory";
    descriptor.parameters = json{
        {"type", "object"},
        {"properties",
         {{"directory_path",
           {{"type", "string"},
            {"description", "Directory to list"},
            {"default", "."}}}}}};
    descriptor.synonyms = {{"directory_path", {"path", "dir", "directory", "folder"}}};
    return descriptor;
}

void register_file_tools(ToolRegistry& registry, std::shared_ptr<const FileTools> file_tools,
                         const std::vector<std::string>& enabled_tools) {
    auto read_descriptor = FileTools::read_file_descriptor();
    read_descriptor.enabled = has_tool(enabled_tools, read_descriptor.name);
    registry.register_tool(std::move(read_descriptor), [file_tools](const json& arguments) {
        return file_tools->read_file(arguments);
    });

    auto write_descriptor = FileTools::write_file_descriptor();
    write_descriptor.enabled = has_tool(enabled_tools, write_descriptor.name);
    registry.register_tool(std::move(write_descriptor), [file_tools](const json& arguments) {
        return file_tools->write_file(arguments);
    });

    auto list_descriptor = FileTools::list_files_descriptor();
    list_descriptor.enabled = has_tool(enabled_tools, list_descriptor.name);
    registry.register_tool(std::move(list_descriptor), [file_tools](const json& arguments) {
        return file_tools->list_files(arguments);
    });

    LOG_INFO("File tools registered with sandbox " +
             file_tools->config().base_directory.string());
}

}  // namespace toolbridge::tools
