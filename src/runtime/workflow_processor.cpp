#include "runtime/workflow_processor.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include "core/errors/workflow_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/batch_executor.hpp"
#include "runtime/hybrid_coordinator.hpp"
#include "runtime/pipeline_executor.hpp"
#include "runtime/request_validator.hpp"
#include "runtime/result_aggregator.hpp"

namespace wfproc::runtime {

using core::errors::ErrorCategory;
using core::errors::WorkflowError;
using protocol::ExecutionMode;
using protocol::WorkflowRequest;
using protocol::WorkflowResult;

namespace {

nlohmann::json internal_failure(const std::string& cause) {
    WFPROC_LOG_ERROR("Workflow aborted by internal failure: " + cause);
    return build_error_response(
        WorkflowError{ErrorCategory::Internal, cause, "internal_error"});
}

}  // namespace

WorkflowProcessor::WorkflowProcessor(tools::ToolDispatcher& dispatcher,
                                     core::config::EngineConfig config)
    : dispatcher_(dispatcher), config_(std::move(config)) {}

WorkflowResult WorkflowProcessor::run(const WorkflowRequest& request) const {
    const PipelineExecutor pipeline(dispatcher_);
    const BatchExecutor batch(dispatcher_);

    switch (request.mode) {
        case ExecutionMode::Pipeline:
            return pipeline.execute(request.pipeline.value(), request.execution_options);
        case ExecutionMode::Batch:
            return batch.execute(request.batch_operations.value(),
                                 request.execution_options.max_parallel,
                                 request.error_handling.max_failures);
        case ExecutionMode::Hybrid:
            return HybridCoordinator(pipeline, batch).execute(request);
    }
    throw std::logic_error("unhandled execution mode");
}

nlohmann::json WorkflowProcessor::execute(const nlohmann::json& params) const {
    try {
        const auto started = std::chrono::steady_clock::now();

        auto validated = validate_request(params, config_);
        if (core::errors::is_error(validated)) {
            const auto& error = core::errors::get_error(validated);
            WFPROC_LOG_ERROR("Rejected workflow request [" + error.code + "]: " +
                             error.message);
            return build_error_response(error);
        }
        const WorkflowRequest& request = core::errors::get_value(validated);
        const std::string mode = protocol::to_string(request.mode);
        WFPROC_LOG_INFO("Accepted " + mode + " workflow");

        WorkflowResult result = run(request);
        result.total_duration_ms = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started)
                .count());

        WFPROC_LOG_INFO("Workflow finished: success=" +
                        std::string(result.success ? "true" : "false") +
                        " completed=" + std::to_string(result.completed_steps) +
                        " failed=" + std::to_string(result.failed_steps) + " in " +
                        std::to_string(result.total_duration_ms) + "ms");
        return build_response(mode, result, result.total_duration_ms);
    } catch (const std::exception& ex) {
        return internal_failure(ex.what());
    } catch (...) {
        return internal_failure("unknown exception");
    }
}

}  // namespace wfproc::runtime
