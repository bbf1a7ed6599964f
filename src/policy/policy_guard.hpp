#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::policy {

struct SandboxPolicy {
    std::filesystem::path base_directory = ".";
    // Lowercase, dot-prefixed. Empty means every extension may be written.
    std::vector<std::string> allowed_extensions;
};

class PolicyGuard {
public:
    explicit PolicyGuard(SandboxPolicy sandbox_policy = {});

    // Resolves `target_path` (relative paths against the base directory) and
    // fails with sandbox_violation when it lands outside the base directory,
    // including through a symbolic link whose target does not exist yet.
    core::errors::Result<std::filesystem::path> validate_path_in_sandbox(
        const std::filesystem::path& target_path) const;

    core::errors::Result<std::string> validate_write_extension(
        const std::filesystem::path& target_path) const;

    const SandboxPolicy& policy() const { return sandbox_policy_; }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static core::errors::Result<std::filesystem::path> resolve_remaining_links(
        const std::filesystem::path& root, std::filesystem::path candidate,
        const std::filesystem::path& requested);
    static std::string lowercase(std::string value);

    SandboxPolicy sandbox_policy_;
};

}  // namespace toolbridge::policy
