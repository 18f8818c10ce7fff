#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/workflow_errors.hpp"

namespace wfproc::tools {

// Performs the work a step or batch operation names. The engine calls it
// synchronously and treats an error result as a failed step. Implementations
// must tolerate concurrent calls from batch workers.
class ToolDispatcher {
public:
    virtual ~ToolDispatcher() = default;

    virtual core::errors::Result<nlohmann::json> invoke(
        const std::string& tool_name, const nlohmann::json& params) = 0;

    virtual core::errors::Result<nlohmann::json> invoke_operation(
        const std::string& file_path, const std::string& operation_type,
        const nlohmann::json& parameters) = 0;

    // Compensation hook. A tool without undo support is left untouched
    // during a rollback.
    virtual bool supports_undo(const std::string& tool_name) const {
        static_cast<void>(tool_name);
        return false;
    }

    // `output` is what invoke() returned for the step being undone.
    virtual core::errors::Result<nlohmann::json> undo(
        const std::string& tool_name, const nlohmann::json& params,
        const nlohmann::json& output) {
        static_cast<void>(params);
        static_cast<void>(output);
        return core::errors::WorkflowError{
            core::errors::ErrorCategory::Execution,
            "Tool has no compensating action: " + tool_name,
            "undo_not_supported"};
    }
};

}  // namespace wfproc::tools
