#pragma once

#include <chrono>
#include <cstdint>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/errors/workflow_errors.hpp"
#include "protocol/workflow_result.hpp"

namespace wfproc::runtime {

// Runs one dispatcher call under a monotonic clock and records its outcome.
// A dispatcher error becomes a failed StepResult; exceptions propagate.
template <typename Call>
protocol::StepResult run_timed_step(Call&& call) {
    const auto started = std::chrono::steady_clock::now();
    const core::errors::Result<nlohmann::json> outcome = std::forward<Call>(call)();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    protocol::StepResult result;
    result.duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        result.success = false;
        result.error_message = error.message.empty() ? error.code : error.message;
        return result;
    }

    result.success = true;
    const auto& output = core::errors::get_value(outcome);
    if (!output.is_null()) {
        result.output = output;
    }
    return result;
}

}  // namespace wfproc::runtime
