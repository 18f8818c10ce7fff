#include "runtime/pipeline_executor.hpp"

#include <string>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "runtime/step_timer.hpp"

namespace wfproc::runtime {

using protocol::ExecutionOptions;
using protocol::FailureKind;
using protocol::OnErrorPolicy;
using protocol::PipelineStep;
using protocol::StepResult;
using protocol::WorkflowResult;

PipelineExecutor::PipelineExecutor(tools::ToolDispatcher& dispatcher)
    : dispatcher_(dispatcher) {}

WorkflowResult PipelineExecutor::execute(const std::vector<PipelineStep>& steps,
                                         const ExecutionOptions& options) const {
    WFPROC_LOG_INFO("Pipeline: running " + std::to_string(steps.size()) +
                    " step(s), atomic=" + (options.atomic ? "true" : "false"));

    WorkflowResult result;
    result.step_results.reserve(steps.size());
    std::vector<bool> settled(steps.size(), false);

    for (std::size_t i = 0; i < steps.size(); ++i) {
        const PipelineStep& step = steps[i];
        WFPROC_LOG_DEBUG("Pipeline: step " + std::to_string(i) + " -> " + step.tool);

        StepResult step_result = run_timed_step(
            [&]() { return dispatcher_.invoke(step.tool, step.params); });
        const bool succeeded = step_result.success;
        result.step_results.push_back(std::move(step_result));

        if (succeeded) {
            ++result.completed_steps;
            continue;
        }

        ++result.failed_steps;
        WFPROC_LOG_WARN("Pipeline: step " + std::to_string(i) + " (" + step.tool +
                        ") failed: " + result.step_results.back().error_message.value_or("") +
                        "; on_error=" + protocol::to_string(step.on_error));

        if (step.on_error == OnErrorPolicy::Continue) {
            continue;
        }
        if (step.on_error == OnErrorPolicy::Rollback) {
            result.rolled_back_steps += compensate(steps, result.step_results, settled);
            continue;
        }

        // Halt.
        if (options.atomic) {
            result.rolled_back_steps += compensate(steps, result.step_results, settled);
        }
        break;
    }

    result.success = result.failed_steps == 0;
    if (!result.success) {
        result.failure_kind = FailureKind::PipelineFailed;
        result.error_message = "One or more pipeline steps failed";
    }
    return result;
}

std::size_t PipelineExecutor::compensate(const std::vector<PipelineStep>& steps,
                                         std::vector<StepResult>& results,
                                         std::vector<bool>& settled) const {
    std::size_t undone = 0;
    for (std::size_t i = results.size(); i-- > 0;) {
        StepResult& committed = results[i];
        if (!committed.success || settled[i]) {
            continue;
        }
        settled[i] = true;

        const PipelineStep& step = steps[i];
        if (!dispatcher_.supports_undo(step.tool)) {
            WFPROC_LOG_WARN("Pipeline: no compensating action for step " +
                            std::to_string(i) + " (" + step.tool + "); left in place");
            continue;
        }

        const nlohmann::json output = committed.output.value_or(nlohmann::json());
        auto undo_result = dispatcher_.undo(step.tool, step.params, output);
        if (core::errors::is_error(undo_result)) {
            const auto& error = core::errors::get_error(undo_result);
            committed.rollback_error = error.message;
            WFPROC_LOG_ERROR("Pipeline: undo of step " + std::to_string(i) + " (" +
                             step.tool + ") failed: " + error.message);
            continue;
        }

        committed.rolled_back = true;
        ++undone;
        WFPROC_LOG_INFO("Pipeline: rolled back step " + std::to_string(i) + " (" +
                        step.tool + ")");
    }
    return undone;
}

}  // namespace wfproc::runtime
