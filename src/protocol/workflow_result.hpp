#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wfproc::protocol {

// Aggregate-level failure conditions. Reported on the response only.
enum class FailureKind {
    None,
    WorkflowFailed,
    PipelineFailed,
    BatchFailed,
    MaxFailuresExceeded
};

struct StepResult {
    bool success = false;
    std::optional<std::string> error_message;
    std::optional<nlohmann::json> output;
    std::uint64_t duration_ms = 0;

    // Set only by the compensation pass.
    bool rolled_back = false;
    std::optional<std::string> rollback_error;
};

struct WorkflowResult {
    bool success = true;
    std::size_t completed_steps = 0;
    std::size_t failed_steps = 0;
    std::uint64_t total_duration_ms = 0;
    std::vector<StepResult> step_results;
    std::optional<std::string> error_message;
    FailureKind failure_kind = FailureKind::None;
    std::size_t rolled_back_steps = 0;
};

inline std::string to_string(const FailureKind kind) {
    switch (kind) {
        case FailureKind::None:
            return "none";
        case FailureKind::WorkflowFailed:
            return "WorkflowFailed";
        case FailureKind::PipelineFailed:
            return "PipelineFailed";
        case FailureKind::BatchFailed:
            return "BatchFailed";
        case FailureKind::MaxFailuresExceeded:
            return "MaxFailuresExceeded";
        default:
            return "unknown";
    }
}

}  // namespace wfproc::protocol
