#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace wfproc::policy {

using core::errors::ErrorCategory;
using core::errors::WorkflowError;

namespace {

bool contains_ignoring_case(const std::string& haystack, const std::string& needle) {
    const auto folded_equal = [](const unsigned char a, const unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    };
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                       folded_equal) != haystack.end();
}

// `relative` is `candidate` expressed against the root; anything that climbs
// out starts with "..".
bool escapes_root(const std::filesystem::path& relative) {
    return relative.empty() || *relative.begin() == "..";
}

}  // namespace

PolicyGuard::PolicyGuard(std::filesystem::path workspace_root,
                         CommandPolicy command_policy)
    : workspace_root_(std::move(workspace_root)),
      command_policy_(std::move(command_policy)) {}

core::errors::Result<std::filesystem::path> PolicyGuard::confine(
    const std::filesystem::path& target) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return WorkflowError{ErrorCategory::Input,
                             "Workspace root is not a directory: " + workspace_root_.string(),
                             "invalid_workspace_root"};
    }
    const auto root = std::filesystem::canonical(workspace_root_, ec);
    if (ec) {
        return WorkflowError{ErrorCategory::Input,
                             "Cannot resolve workspace root: " + workspace_root_.string(),
                             "invalid_workspace_root"};
    }

    // weakly_canonical follows symlinks in the existing prefix, so a link
    // pointing outside the root is caught below.
    const auto candidate = std::filesystem::weakly_canonical(
        target.is_absolute() ? target : root / target, ec);
    if (ec) {
        return WorkflowError{ErrorCategory::Input,
                             "Cannot resolve path: " + target.string(), "invalid_path"};
    }

    if (escapes_root(candidate.lexically_relative(root))) {
        WFPROC_LOG_WARN("PolicyGuard: '" + target.string() + "' resolves outside " +
                        root.string());
        return WorkflowError{ErrorCategory::Policy,
                             "Path escapes workspace root: " + candidate.string(),
                             "path_outside_workspace"};
    }
    return candidate;
}

core::errors::Result<std::filesystem::path> PolicyGuard::admit_path(
    const std::filesystem::path& target, const PathIntent intent) const {
    if (target.empty()) {
        return WorkflowError{ErrorCategory::Input, "Path cannot be empty.", "invalid_path"};
    }

    auto confined = confine(target);
    if (core::errors::is_error(confined)) {
        return confined;
    }
    const std::filesystem::path& path = core::errors::get_value(confined);

    std::error_code ec;
    switch (intent) {
        case PathIntent::Modify:
            if (std::filesystem::is_directory(path, ec)) {
                return WorkflowError{ErrorCategory::Policy,
                                     "Refusing to modify a directory: " + path.string(),
                                     "path_is_directory"};
            }
            break;
        case PathIntent::RunIn:
            if (!std::filesystem::is_directory(path, ec)) {
                return WorkflowError{ErrorCategory::Input,
                                     "Working directory does not exist: " + path.string(),
                                     "not_a_directory"};
            }
            break;
        case PathIntent::Read:
        case PathIntent::Scan:
            break;
    }
    return confined;
}

core::errors::Result<std::string> PolicyGuard::admit_command(
    const std::string& command) const {
    if (command.empty()) {
        return WorkflowError{ErrorCategory::Input, "Command cannot be empty.",
                             "empty_command"};
    }
    for (const auto& blocked : command_policy_.blocked_substrings) {
        if (blocked.empty() || !contains_ignoring_case(command, blocked)) {
            continue;
        }
        WFPROC_LOG_WARN("PolicyGuard: refused command containing '" + blocked + "'");
        return WorkflowError{ErrorCategory::Policy,
                             "Command contains blocked operation: " + blocked,
                             "blocked_command"};
    }
    return command;
}

}  // namespace wfproc::policy
