#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/workflow_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_dispatcher.hpp"

namespace wfproc::tools {

struct SearchRequest {
    std::string pattern;
    std::filesystem::path scope = ".";
    std::size_t max_matches = 20;
};

struct CommandRequest {
    std::string command;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 5000;
};

struct WriteRequest {
    std::filesystem::path path;
    std::string content;
};

// Built-in dispatcher for the file and shell tools, confined to one
// workspace root. Stateless apart from its configuration, so batch workers
// may share one instance.
class ToolHost : public ToolDispatcher {
public:
    explicit ToolHost(std::filesystem::path workspace_root,
                      policy::CommandPolicy command_policy = {});

    core::errors::Result<protocol::ToolResult> read_file(
        const std::filesystem::path& path) const;

    core::errors::Result<protocol::ToolResult> write_file(
        const WriteRequest& request) const;

    core::errors::Result<protocol::ToolResult> delete_file(
        const std::filesystem::path& path) const;

    core::errors::Result<protocol::ToolResult> search(
        const SearchRequest& request) const;

    core::errors::Result<protocol::ToolResult> run_command(
        const CommandRequest& request) const;

    core::errors::Result<nlohmann::json> invoke(
        const std::string& tool_name, const nlohmann::json& params) override;

    core::errors::Result<nlohmann::json> invoke_operation(
        const std::string& file_path, const std::string& operation_type,
        const nlohmann::json& parameters) override;

    bool supports_undo(const std::string& tool_name) const override;

    core::errors::Result<nlohmann::json> undo(
        const std::string& tool_name, const nlohmann::json& params,
        const nlohmann::json& output) override;

private:
    policy::PolicyGuard policy_guard_;
};

}  // namespace wfproc::tools
