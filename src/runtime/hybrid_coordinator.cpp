#include "runtime/hybrid_coordinator.hpp"

#include <iterator>
#include <utility>
#include "core/logging/logger.hpp"

namespace wfproc::runtime {

using protocol::FailureKind;
using protocol::WorkflowRequest;
using protocol::WorkflowResult;

HybridCoordinator::HybridCoordinator(const PipelineExecutor& pipeline,
                                     const BatchExecutor& batch)
    : pipeline_(pipeline), batch_(batch) {}

WorkflowResult HybridCoordinator::execute(const WorkflowRequest& request) const {
    WorkflowResult pipeline_result =
        pipeline_.execute(request.pipeline.value(), request.execution_options);
    if (!pipeline_result.success) {
        WFPROC_LOG_INFO("Hybrid: pipeline phase failed; batch phase skipped");
        return pipeline_result;
    }

    WorkflowResult batch_result =
        batch_.execute(request.batch_operations.value(),
                       request.execution_options.max_parallel,
                       request.error_handling.max_failures);

    WorkflowResult combined = std::move(pipeline_result);
    combined.step_results.insert(combined.step_results.end(),
                                 std::make_move_iterator(batch_result.step_results.begin()),
                                 std::make_move_iterator(batch_result.step_results.end()));
    combined.completed_steps += batch_result.completed_steps;
    combined.failed_steps += batch_result.failed_steps;
    combined.success = combined.success && batch_result.success;
    if (!combined.success) {
        combined.failure_kind = batch_result.failure_kind == FailureKind::MaxFailuresExceeded
                                    ? FailureKind::MaxFailuresExceeded
                                    : FailureKind::WorkflowFailed;
        combined.error_message = "Hybrid workflow had failures";
    }
    return combined;
}

}  // namespace wfproc::runtime
