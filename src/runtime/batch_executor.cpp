#include "runtime/batch_executor.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/step_timer.hpp"
#include "runtime/worker_pool.hpp"

namespace wfproc::runtime {

using protocol::BatchOperation;
using protocol::FailureKind;
using protocol::StepResult;
using protocol::WorkflowResult;

namespace {

// Shared between the submitting thread and the workers of one batch.
struct BatchState {
    std::mutex mutex;
    std::condition_variable slot_freed;
    std::vector<std::optional<StepResult>> slots;
    std::size_t in_flight = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::exception_ptr fault;
};

}  // namespace

BatchExecutor::BatchExecutor(tools::ToolDispatcher& dispatcher,
                             WorkerPool::Spawner spawner)
    : dispatcher_(dispatcher), spawner_(std::move(spawner)) {}

WorkflowResult BatchExecutor::execute(const std::vector<BatchOperation>& operations,
                                      const std::size_t max_parallel,
                                      const std::size_t max_failures) const {
    const std::size_t limit = std::max<std::size_t>(1, max_parallel);
    WFPROC_LOG_INFO("Batch: running " + std::to_string(operations.size()) +
                    " operation(s), max_parallel=" + std::to_string(limit) +
                    ", max_failures=" + std::to_string(max_failures));

    BatchState state;
    state.slots.resize(operations.size());
    std::size_t submitted = 0;

    if (!operations.empty()) {
        WorkerPool pool(std::min(limit, operations.size()), spawner_);

        for (std::size_t index = 0; index < operations.size(); ++index) {
            std::unique_lock<std::mutex> lock(state.mutex);
            state.slot_freed.wait(lock, [&] { return state.in_flight < limit; });

            if (state.fault) {
                break;
            }
            if (state.failed >= max_failures) {
                WFPROC_LOG_WARN("Batch: circuit breaker tripped after " +
                                std::to_string(state.failed) + " failure(s); " +
                                std::to_string(operations.size() - index) +
                                " operation(s) not submitted");
                break;
            }

            ++state.in_flight;
            ++submitted;
            lock.unlock();

            const BatchOperation& operation = operations[index];
            pool.submit([this, &state, &operation, index]() {
                std::optional<StepResult> outcome;
                std::exception_ptr fault;
                try {
                    outcome = run_timed_step([&]() {
                        return dispatcher_.invoke_operation(operation.file_path,
                                                            operation.operation_type,
                                                            operation.parameters);
                    });
                } catch (...) {
                    fault = std::current_exception();
                }

                std::lock_guard<std::mutex> guard(state.mutex);
                if (outcome.has_value()) {
                    if (outcome->success) {
                        ++state.completed;
                    } else {
                        ++state.failed;
                        WFPROC_LOG_WARN("Batch: operation " + std::to_string(index) + " (" +
                                        operation.operation_type + " " +
                                        operation.file_path + ") failed: " +
                                        outcome->error_message.value_or(""));
                    }
                    state.slots[index] = std::move(outcome);
                } else if (!state.fault) {
                    state.fault = fault;
                }
                --state.in_flight;
                state.slot_freed.notify_all();
            });
        }

        std::unique_lock<std::mutex> lock(state.mutex);
        state.slot_freed.wait(lock, [&] { return state.in_flight == 0; });
    }

    if (state.fault) {
        std::rethrow_exception(state.fault);
    }

    WorkflowResult result;
    result.completed_steps = state.completed;
    result.failed_steps = state.failed;
    result.step_results.reserve(submitted);
    for (std::size_t index = 0; index < submitted; ++index) {
        result.step_results.push_back(std::move(state.slots[index].value()));
    }

    result.success = result.failed_steps == 0;
    if (result.failed_steps >= max_failures) {
        result.failure_kind = FailureKind::MaxFailuresExceeded;
        result.error_message = "Batch stopped after reaching max_failures (" +
                               std::to_string(max_failures) + ")";
    } else if (!result.success) {
        result.failure_kind = FailureKind::BatchFailed;
        result.error_message = "One or more batch operations failed";
    }
    return result;
}

}  // namespace wfproc::runtime
