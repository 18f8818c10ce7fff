#include "runtime/result_aggregator.hpp"

#include "protocol/tool_contract.hpp"

namespace wfproc::runtime {

using nlohmann::json;

namespace {

// Tool output carries raw file bytes and process output. Invalid UTF-8 is
// replaced with U+FFFD so the response always serializes.
json with_valid_utf8(const json& payload) {
    return json::parse(payload.dump(-1, ' ', false, json::error_handler_t::replace));
}

}  // namespace

json step_to_json(const protocol::StepResult& step) {
    json payload;
    payload["success"] = step.success;
    payload["duration_ms"] = step.duration_ms;
    if (step.error_message.has_value()) {
        payload["error_message"] = step.error_message.value();
    }
    if (step.output.has_value()) {
        payload["output"] = step.output.value();
    }
    if (step.rolled_back) {
        payload["rolled_back"] = true;
    }
    if (step.rollback_error.has_value()) {
        payload["rollback_error"] = step.rollback_error.value();
    }
    return payload;
}

json build_response(const std::string& mode, const protocol::WorkflowResult& result,
                    const std::uint64_t total_duration_ms) {
    json response;
    response["success"] = result.success;
    response["tool"] = protocol::kEngineToolName;
    response["mode"] = mode;
    response["completed_steps"] = result.completed_steps;
    response["failed_steps"] = result.failed_steps;
    response["total_duration_ms"] = total_duration_ms;
    if (result.error_message.has_value()) {
        response["error_message"] = result.error_message.value();
    }
    if (result.failure_kind != protocol::FailureKind::None) {
        response["failure_kind"] = protocol::to_string(result.failure_kind);
    }
    if (result.rolled_back_steps > 0) {
        response["rolled_back_steps"] = result.rolled_back_steps;
    }

    json steps = json::array();
    for (const auto& step : result.step_results) {
        steps.push_back(step_to_json(step));
    }
    response["step_results"] = std::move(steps);
    return with_valid_utf8(response);
}

json build_error_response(const core::errors::WorkflowError& error) {
    json response;
    response["success"] = false;
    response["tool"] = protocol::kEngineToolName;
    response["error"] = core::errors::error_name(error);
    response["error_code"] = error.code;
    response["message"] = error.message;
    if (!error.hint.empty()) {
        response["hint"] = error.hint;
    }
    return with_valid_utf8(response);
}

}  // namespace wfproc::runtime
