#pragma once

#include <nlohmann/json.hpp>
#include "core/config/engine_config.hpp"
#include "core/errors/workflow_errors.hpp"
#include "protocol/workflow_request.hpp"

namespace wfproc::runtime {

// Turns a raw JSON request into a WorkflowRequest, or fails with
// unknown_command / invalid_parameters before any step runs.
core::errors::Result<protocol::WorkflowRequest> validate_request(
    const nlohmann::json& raw, const core::config::EngineConfig& config = {});

}  // namespace wfproc::runtime
