#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <system_error>
#include <utility>

namespace toolbridge::policy {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
namespace codes = core::errors::codes;

namespace {

// Same bound as Linux's MAXSYMLINKS.
constexpr int kMaxSymlinkHops = 40;

}  // namespace

PolicyGuard::PolicyGuard(SandboxPolicy sandbox_policy)
    : sandbox_policy_(std::move(sandbox_policy)) {
    for (auto& ext : sandbox_policy_.allowed_extensions) {
        ext = lowercase(ext);
    }
}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    // A trailing separator on the root shows up as an empty final element.
    if (root_it != root.end() && root_it->empty() && std::next(root_it) == root.end()) {
        return true;
    }
    return root_it == root.end();
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_sandbox(
    const std::filesystem::path& target_path) const {
    const auto& base_directory = sandbox_policy_.base_directory;
    std::error_code ec;
    if (!std::filesystem::exists(base_directory, ec) || ec) {
        return BridgeError{ErrorCategory::Input,
                           "Sandbox base directory does not exist: " +
                               base_directory.string(),
                           codes::kNotFound};
    }
    if (!std::filesystem::is_directory(base_directory, ec) || ec) {
        return BridgeError{ErrorCategory::Input,
                           "Sandbox base directory is not a directory: " +
                               base_directory.string(),
                           codes::kWrongType};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(std::filesystem::absolute(base_directory, ec), ec);
    if (ec) {
        return BridgeError{ErrorCategory::Internal,
                           "Unable to resolve sandbox base directory: " +
                               base_directory.string(),
                           codes::kIoFailure};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Input,
                           "Unable to resolve path: " + target_path.string(),
                           codes::kIoFailure};
    }

    return resolve_remaining_links(canonical_root, canonical_candidate, target_path);
}

core::errors::Result<std::filesystem::path> PolicyGuard::resolve_remaining_links(
    const std::filesystem::path& root, std::filesystem::path candidate,
    const std::filesystem::path& requested) {
    // weakly_canonical stops at the first missing component, so a dangling
    // link (and anything after it) is still unresolved here. Opening the path
    // would follow it, so each one is resolved and contained again.
    for (int hops = 0; hops <= kMaxSymlinkHops; ++hops) {
        if (!is_within_root(root, candidate)) {
            return BridgeError{ErrorCategory::Policy,
                               "Path is outside the allowed directory: " + requested.string(),
                               codes::kSandboxViolation,
                               "Use a path inside " + root.string()};
        }

        std::filesystem::path prefix;
        std::filesystem::path remainder;
        bool found_link = false;
        for (const auto& part : candidate) {
            if (found_link) {
                remainder /= part;
                continue;
            }
            prefix /= part;
            std::error_code ec;
            const auto status = std::filesystem::symlink_status(prefix, ec);
            if (ec || status.type() == std::filesystem::file_type::not_found) {
                break;
            }
            found_link = std::filesystem::is_symlink(status);
        }
        if (!found_link) {
            return candidate;
        }

        std::error_code ec;
        std::filesystem::path target = std::filesystem::read_symlink(prefix, ec);
        if (ec) {
            return BridgeError{ErrorCategory::Execution,
                               "Unable to read symbolic link: " + prefix.string(),
                               codes::kIoFailure};
        }
        if (target.is_relative()) {
            target = prefix.parent_path() / target;
        }
        candidate = std::filesystem::weakly_canonical(
            remainder.empty() ? target : target / remainder, ec);
        if (ec) {
            return BridgeError{ErrorCategory::Input,
                               "Unable to resolve path: " + requested.string(),
                               codes::kIoFailure};
        }
    }
    return BridgeError{ErrorCategory::Input,
                       "Too many levels of symbolic links: " + requested.string(),
                       codes::kIoFailure};
}

core::errors::Result<std::string> PolicyGuard::validate_write_extension(
    const std::filesystem::path& target_path) const {
    const std::string extension = lowercase(target_path.extension().string());
    const auto& allowed = sandbox_policy_.allowed_extensions;
    if (allowed.empty()) {
        return extension;
    }
    if (std::find(allowed.begin(), allowed.end(), extension) != allowed.end()) {
        return extension;
    }

    std::string allowed_list;
    for (const auto& ext : allowed) {
        if (!allowed_list.empty()) {
            allowed_list += ", ";
        }
        allowed_list += ext;
    }
    return BridgeError{ErrorCategory::Policy,
                       "File extension not allowed: " +
                           (extension.empty() ? std::string("(none)") : extension) +
                           ". Allowed extensions: " + allowed_list,
                       codes::kSandboxViolation};
}

}  // namespace toolbridge::policy
