#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wfproc::protocol {

enum class ExecutionMode {
    Pipeline,
    Batch,
    Hybrid
};

enum class OnErrorPolicy {
    Halt,
    Continue,
    Rollback
};

struct PipelineStep {
    std::string tool;
    nlohmann::json params = nlohmann::json::object();
    OnErrorPolicy on_error = OnErrorPolicy::Halt;
};

struct BatchOperation {
    std::string file_path;
    std::string operation_type;
    nlohmann::json parameters = nlohmann::json::object();
};

struct ExecutionOptions {
    bool atomic = true;
    std::size_t max_parallel = 3;
};

struct ErrorHandlingOptions {
    std::size_t max_failures = 10;
};

// A validated request. Only the collections the mode needs are populated.
struct WorkflowRequest {
    ExecutionMode mode = ExecutionMode::Pipeline;
    std::optional<std::vector<PipelineStep>> pipeline;
    std::optional<std::vector<BatchOperation>> batch_operations;
    ExecutionOptions execution_options;
    ErrorHandlingOptions error_handling;
};

inline std::string to_string(const ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Pipeline:
            return "pipeline";
        case ExecutionMode::Batch:
            return "batch";
        case ExecutionMode::Hybrid:
            return "hybrid";
        default:
            return "unknown";
    }
}

inline std::string to_string(const OnErrorPolicy policy) {
    switch (policy) {
        case OnErrorPolicy::Halt:
            return "halt";
        case OnErrorPolicy::Continue:
            return "continue";
        case OnErrorPolicy::Rollback:
            return "rollback";
        default:
            return "unknown";
    }
}

inline std::optional<ExecutionMode> parse_execution_mode(const std::string& text) {
    if (text == "pipeline") return ExecutionMode::Pipeline;
    if (text == "batch") return ExecutionMode::Batch;
    if (text == "hybrid") return ExecutionMode::Hybrid;
    return std::nullopt;
}

inline std::optional<OnErrorPolicy> parse_on_error_policy(const std::string& text) {
    if (text == "halt") return OnErrorPolicy::Halt;
    if (text == "continue") return OnErrorPolicy::Continue;
    if (text == "rollback") return OnErrorPolicy::Rollback;
    return std::nullopt;
}

}  // namespace wfproc::protocol
