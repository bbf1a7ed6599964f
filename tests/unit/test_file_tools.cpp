#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/gateway_config.hpp"
#include "core/config/instance_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "tools/file_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

using nlohmann::json;
using toolbridge::core::config::SandboxConfig;
using toolbridge::core::errors::get_error;
using toolbridge::core::errors::get_value;
using toolbridge::core::errors::is_error;
using toolbridge::tools::FileTools;
using toolbridge::tools::ToolRegistry;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_file_tools_" + toolbridge::core::config::generate_instance_id());
        std::filesystem::create_directories(root_ / "sandbox");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path sandbox() const { return root_ / "sandbox"; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_back(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

SandboxConfig sandbox_config(const std::filesystem::path& base) {
    SandboxConfig config;
    config.base_directory = base;
    return config;
}

TEST(FileToolsTest, WriteThenReadRoundTrip) {
    TempWorkspace workspace;
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto written = tools.write_file(json{{"file_path", "notes/today.txt"}, {"content", "hello"}});
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(get_value(written)["bytes_written"], 5);
    EXPECT_EQ(get_value(written)["created_directories"], true);

    auto read = tools.read_file(json{{"file_path", "notes/today.txt"}});
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read)["content"], "hello");
    EXPECT_EQ(get_value(read)["size"], 5);
    EXPECT_FALSE(get_value(read).contains("encoding"));
}

TEST(FileToolsTest, ReadReportsFallbackEncoding) {
    TempWorkspace workspace;
    write_file(workspace.sandbox() / "legacy.txt", "caf\xE9");
    auto config = sandbox_config(workspace.sandbox());
    config.fallback_encodings = {"ISO-8859-1"};
    FileTools tools(config);

    auto read = tools.read_file(json{{"file_path", "legacy.txt"}});
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read)["content"], "caf\xC3\xA9");
    EXPECT_EQ(get_value(read)["encoding"], "ISO-8859-1");
}

TEST(FileToolsTest, RejectsWriteOutsideSandboxWithoutTouchingDisk) {
    TempWorkspace workspace;
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto result = tools.write_file(json{{"file_path", "../escaped.txt"}, {"content", "x"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "sandbox_violation");
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "escaped.txt"));
}

TEST(FileToolsTest, RejectsReadOutsideSandbox) {
    TempWorkspace workspace;
    write_file(workspace.root() / "secret.txt", "top secret");
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto relative = tools.read_file(json{{"file_path", "../secret.txt"}});
    ASSERT_TRUE(is_error(relative));
    EXPECT_EQ(get_error(relative).code, "sandbox_violation");

    auto absolute = tools.read_file(json{{"file_path", (workspace.root() / "secret.txt").string()}});
    ASSERT_TRUE(is_error(absolute));
    EXPECT_EQ(get_error(absolute).code, "sandbox_violation");
}

TEST(FileToolsTest, RejectsListOutsideSandbox) {
    TempWorkspace workspace;
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto parent = tools.list_files(json{{"directory_path", ".."}});
    ASSERT_TRUE(is_error(parent));
    EXPECT_EQ(get_error(parent).code, "sandbox_violation");

    auto absolute = tools.list_files(json{{"directory_path", workspace.root().string()}});
    ASSERT_TRUE(is_error(absolute));
    EXPECT_EQ(get_error(absolute).code, "sandbox_violation");
}

TEST(FileToolsTest, RejectsSymlinkEscape) {
    TempWorkspace workspace;
    write_file(workspace.root() / "existing.txt", "original");
    // One link to a file that does not exist yet, one to a file that does.
    std::filesystem::create_symlink("../outside.txt", workspace.sandbox() / "link.txt");
    std::filesystem::create_symlink("../existing.txt", workspace.sandbox() / "existing_link.txt");
    std::filesystem::create_directory_symlink("..", workspace.sandbox() / "up");
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto dangling = tools.write_file(json{{"file_path", "link.txt"}, {"content", "pwned"}});
    ASSERT_TRUE(is_error(dangling));
    EXPECT_EQ(get_error(dangling).code, "sandbox_violation");
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "outside.txt"));

    auto existing = tools.write_file(json{{"file_path", "existing_link.txt"}, {"content", "pwned"}});
    ASSERT_TRUE(is_error(existing));
    EXPECT_EQ(get_error(existing).code, "sandbox_violation");
    EXPECT_EQ(read_back(workspace.root() / "existing.txt"), "original");

    auto read = tools.read_file(json{{"file_path", "existing_link.txt"}});
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).code, "sandbox_violation");

    auto listed = tools.list_files(json{{"directory_path", "up"}});
    ASSERT_TRUE(is_error(listed));
    EXPECT_EQ(get_error(listed).code, "sandbox_violation");
}

TEST(FileToolsTest, FollowsSymlinkThatStaysInsideSandbox) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.sandbox() / "data");
    std::filesystem::create_symlink("data/target.txt", workspace.sandbox() / "alias.txt");
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto written = tools.write_file(json{{"file_path", "alias.txt"}, {"content", "inside"}});
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(read_back(workspace.sandbox() / "data" / "target.txt"), "inside");
}

TEST(FileToolsTest, RejectsDisallowedExtension) {
    TempWorkspace workspace;
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto result = tools.write_file(json{{"file_path", "script.sh"}, {"content", "rm -rf /"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "sandbox_violation");
    EXPECT_FALSE(std::filesystem::exists(workspace.sandbox() / "script.sh"));
}

TEST(FileToolsTest, RejectsOversizedReadAndWrite) {
    TempWorkspace workspace;
    write_file(workspace.sandbox() / "big.txt", std::string(64, 'a'));
    auto config = sandbox_config(workspace.sandbox());
    config.max_file_size = 16;
    FileTools tools(config);

    auto read = tools.read_file(json{{"file_path", "big.txt"}});
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).code, "too_large");

    auto write = tools.write_file(json{{"file_path", "small.txt"}, {"content", std::string(17, 'b')}});
    ASSERT_TRUE(is_error(write));
    EXPECT_EQ(get_error(write).code, "too_large");
    EXPECT_FALSE(std::filesystem::exists(workspace.sandbox() / "small.txt"));
}

TEST(FileToolsTest, MissingParentFailsWhenDirectoryCreationDisabled) {
    TempWorkspace workspace;
    auto config = sandbox_config(workspace.sandbox());
    config.create_directories = false;
    FileTools tools(config);

    auto result = tools.write_file(json{{"file_path", "deep/nested/a.txt"}, {"content", "x"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "not_found");
    EXPECT_FALSE(std::filesystem::exists(workspace.sandbox() / "deep"));
}

TEST(FileToolsTest, OverwritesExistingFile) {
    TempWorkspace workspace;
    write_file(workspace.sandbox() / "a.txt", "old content");
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto result = tools.write_file(json{{"file_path", "a.txt"}, {"content", "new"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["created_directories"], false);
    EXPECT_EQ(read_back(workspace.sandbox() / "a.txt"), "new");
}

TEST(FileToolsTest, ReadReportsMissingAndWrongType) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.sandbox() / "dir");
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto missing = tools.read_file(json{{"file_path", "nope.txt"}});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "not_found");

    auto directory = tools.read_file(json{{"file_path", "dir"}});
    ASSERT_TRUE(is_error(directory));
    EXPECT_EQ(get_error(directory).code, "wrong_type");
}

TEST(FileToolsTest, ListsEntriesSortedByName) {
    TempWorkspace workspace;
    write_file(workspace.sandbox() / "b.txt", "bb");
    write_file(workspace.sandbox() / "a.txt", "a");
    std::filesystem::create_directories(workspace.sandbox() / "c_dir");
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto result = tools.list_files(json{{"directory_path", "."}});
    ASSERT_FALSE(is_error(result));
    const auto& listing = get_value(result);
    ASSERT_EQ(listing["entries"].size(), 3u);
    EXPECT_EQ(listing["entries"][0]["name"], "a.txt");
    EXPECT_EQ(listing["entries"][0]["type"], "file");
    EXPECT_EQ(listing["entries"][0]["size"], 1);
    EXPECT_EQ(listing["entries"][1]["name"], "b.txt");
    EXPECT_EQ(listing["entries"][2]["name"], "c_dir");
    EXPECT_EQ(listing["entries"][2]["type"], "directory");
    EXPECT_EQ(listing["total_files"], 2);
    EXPECT_EQ(listing["total_dirs"], 1);
    EXPECT_EQ(listing["empty"], false);
}

TEST(FileToolsTest, ListsEmptyDirectory) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.sandbox() / "empty");
    FileTools tools(sandbox_config(workspace.sandbox()));

    auto result = tools.list_files(json{{"directory_path", "empty"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["empty"], true);
    EXPECT_TRUE(get_value(result)["entries"].empty());
}

TEST(FileToolsTest, RegisteredToolsAcceptArgumentAliases) {
    TempWorkspace workspace;
    ToolRegistry registry;
    auto tools = std::make_shared<const FileTools>(sandbox_config(workspace.sandbox()));
    toolbridge::tools::register_file_tools(registry, tools, {"read_file", "write_file"});

    auto written = registry.invoke("write_file", json{{"path", "alias.md"}, {"text", "# hi"}});
    ASSERT_TRUE(written.success);
    EXPECT_EQ(read_back(workspace.sandbox() / "alias.md"), "# hi");

    auto read = registry.invoke("read_file", json{{"kwargs", {{"filename", "alias.md"}}}});
    ASSERT_TRUE(read.success);
    EXPECT_EQ(read.result["content"], "# hi");

    // list_files was left out of the enabled set
    auto listed = registry.invoke("list_files", json::object());
    EXPECT_FALSE(listed.success);
    EXPECT_EQ(listed.error_code, "unknown_tool");
    EXPECT_TRUE(registry.contains("list_files"));
}

}  // namespace
