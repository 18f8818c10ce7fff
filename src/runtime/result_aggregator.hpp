#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/workflow_errors.hpp"
#include "protocol/workflow_result.hpp"

namespace wfproc::runtime {

nlohmann::json step_to_json(const protocol::StepResult& step);

// Caller-facing response for a run that produced a WorkflowResult.
nlohmann::json build_response(const std::string& mode,
                              const protocol::WorkflowResult& result,
                              std::uint64_t total_duration_ms);

// Caller-facing response when no WorkflowResult exists: request-level errors
// and unexpected internal failures.
nlohmann::json build_error_response(const core::errors::WorkflowError& error);

}  // namespace wfproc::runtime
