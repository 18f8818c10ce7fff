#pragma once

#include <cstddef>
#include <vector>
#include "protocol/workflow_request.hpp"
#include "protocol/workflow_result.hpp"
#include "tools/tool_dispatcher.hpp"

namespace wfproc::runtime {

// Runs steps one at a time, in order, on the calling thread and applies each
// step's on_error policy when it fails.
class PipelineExecutor {
public:
    explicit PipelineExecutor(tools::ToolDispatcher& dispatcher);

    protocol::WorkflowResult execute(const std::vector<protocol::PipelineStep>& steps,
                                     const protocol::ExecutionOptions& options) const;

private:
    // Undoes committed steps in reverse order. `settled[i]` marks steps that
    // were already offered to the compensation hook. Returns how many steps
    // were undone.
    std::size_t compensate(const std::vector<protocol::PipelineStep>& steps,
                           std::vector<protocol::StepResult>& results,
                           std::vector<bool>& settled) const;

    tools::ToolDispatcher& dispatcher_;
};

}  // namespace wfproc::runtime
