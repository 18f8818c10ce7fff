#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/workflow_errors.hpp"

namespace wfproc::policy {

// What a tool is about to do with a workspace path.
enum class PathIntent {
    Read,    // read_file
    Modify,  // write_file, delete_file: must not name a directory
    Scan,    // search scope: file or directory
    RunIn    // run_command cwd: must be an existing directory
};

struct CommandPolicy {
    std::vector<std::string> blocked_substrings = {
        "sudo",
        "rm -rf",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:"};
};

// Admission checks for everything the built-in tools receive from a step or
// a batch operation. Paths are confined to one workspace root.
class PolicyGuard {
public:
    explicit PolicyGuard(std::filesystem::path workspace_root,
                         CommandPolicy command_policy = {});

    // Resolves `target` (relative to the workspace root, or absolute) to a
    // normalized absolute path inside the root that suits `intent`.
    core::errors::Result<std::filesystem::path> admit_path(
        const std::filesystem::path& target, PathIntent intent) const;

    // Rejects empty commands and any command containing a blocked substring,
    // compared case-insensitively.
    core::errors::Result<std::string> admit_command(const std::string& command) const;

private:
    core::errors::Result<std::filesystem::path> confine(
        const std::filesystem::path& target) const;

    std::filesystem::path workspace_root_;
    CommandPolicy command_policy_;
};

}  // namespace wfproc::policy
