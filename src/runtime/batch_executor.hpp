#pragma once

#include <cstddef>
#include <vector>
#include "protocol/workflow_request.hpp"
#include "protocol/workflow_result.hpp"
#include "runtime/worker_pool.hpp"
#include "tools/tool_dispatcher.hpp"

namespace wfproc::runtime {

// Runs independent operations with at most `max_parallel` dispatcher calls in
// flight. Submission stops once `max_failures` operations have failed;
// operations already running drain and keep their slots.
class BatchExecutor {
public:
    explicit BatchExecutor(tools::ToolDispatcher& dispatcher,
                           WorkerPool::Spawner spawner = WorkerPool::spawn_thread);

    protocol::WorkflowResult execute(const std::vector<protocol::BatchOperation>& operations,
                                     std::size_t max_parallel,
                                     std::size_t max_failures) const;

private:
    tools::ToolDispatcher& dispatcher_;
    WorkerPool::Spawner spawner_;
};

}  // namespace wfproc::runtime
