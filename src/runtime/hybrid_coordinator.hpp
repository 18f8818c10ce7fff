#pragma once

#include "protocol/workflow_request.hpp"
#include "protocol/workflow_result.hpp"
#include "runtime/batch_executor.hpp"
#include "runtime/pipeline_executor.hpp"

namespace wfproc::runtime {

// Pipeline first; the batch phase runs only when the pipeline succeeded.
class HybridCoordinator {
public:
    HybridCoordinator(const PipelineExecutor& pipeline, const BatchExecutor& batch);

    protocol::WorkflowResult execute(const protocol::WorkflowRequest& request) const;

private:
    const PipelineExecutor& pipeline_;
    const BatchExecutor& batch_;
};

}  // namespace wfproc::runtime
