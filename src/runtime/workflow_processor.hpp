#pragma once

#include <nlohmann/json.hpp>
#include "core/config/engine_config.hpp"
#include "protocol/workflow_request.hpp"
#include "protocol/workflow_result.hpp"
#include "tools/tool_dispatcher.hpp"

namespace wfproc::runtime {

// Public entry point of the engine. Holds no state between calls; the
// dispatcher is injected and must outlive the processor.
class WorkflowProcessor {
public:
    explicit WorkflowProcessor(tools::ToolDispatcher& dispatcher,
                               core::config::EngineConfig config = {});

    // Validates `params`, runs the requested mode and returns the response
    // object. Never throws: request errors and internal failures come back as
    // {success:false, tool:"workflow_processor", error:<name>}.
    nlohmann::json execute(const nlohmann::json& params) const;

    // Runs an already validated request. Exceptions from the dispatcher
    // propagate to the caller.
    protocol::WorkflowResult run(const protocol::WorkflowRequest& request) const;

private:
    tools::ToolDispatcher& dispatcher_;
    core::config::EngineConfig config_;
};

}  // namespace wfproc::runtime
