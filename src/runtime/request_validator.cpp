#include "runtime/request_validator.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace wfproc::runtime {

using core::errors::ErrorCategory;
using core::errors::WorkflowError;
using nlohmann::json;
using protocol::BatchOperation;
using protocol::ExecutionMode;
using protocol::PipelineStep;
using protocol::WorkflowRequest;

namespace {

WorkflowError invalid(const std::string& message, const std::string& hint = "") {
    return WorkflowError{ErrorCategory::Input, message,
                         core::errors::kInvalidParameters, hint};
}

// Reads an integer option in [1, upper]; absent keys keep `value` untouched.
core::errors::Result<std::size_t> read_count(const json& section, const char* key,
                                             std::size_t value, std::uint64_t upper) {
    const auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return value;
    }
    if (!it->is_number_integer()) {
        return invalid(std::string(key) + " must be an integer");
    }
    if (!it->is_number_unsigned() && it->get<std::int64_t>() < 1) {
        return invalid(std::string(key) + " must be at least 1");
    }
    const auto parsed = it->get<std::uint64_t>();
    if (parsed < 1) {
        return invalid(std::string(key) + " must be at least 1");
    }
    if (parsed > upper) {
        return invalid(std::string(key) + " must be at most " + std::to_string(upper));
    }
    return static_cast<std::size_t>(parsed);
}

core::errors::Result<std::vector<PipelineStep>> parse_pipeline(const json& raw) {
    const auto it = raw.find("pipeline");
    if (it == raw.end() || !it->is_array()) {
        return invalid("Mode requires a 'pipeline' array",
                       "Provide pipeline: [{tool, params, on_error?}]");
    }

    std::vector<PipelineStep> steps;
    steps.reserve(it->size());
    for (std::size_t i = 0; i < it->size(); ++i) {
        const json& entry = (*it)[i];
        const std::string where = "pipeline[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            return invalid(where + " must be an object");
        }

        PipelineStep step;
        const auto tool = entry.find("tool");
        if (tool == entry.end() || !tool->is_string() ||
            tool->get<std::string>().empty()) {
            return invalid(where + ".tool must be a non-empty string");
        }
        step.tool = tool->get<std::string>();

        const auto params = entry.find("params");
        if (params != entry.end() && !params->is_null()) {
            if (!params->is_object()) {
                return invalid(where + ".params must be an object");
            }
            step.params = *params;
        }

        const auto on_error = entry.find("on_error");
        if (on_error != entry.end() && !on_error->is_null()) {
            if (!on_error->is_string()) {
                return invalid(where + ".on_error must be a string");
            }
            const auto policy =
                protocol::parse_on_error_policy(on_error->get<std::string>());
            if (!policy.has_value()) {
                return invalid(where + ".on_error is not a known policy: " +
                                   on_error->get<std::string>(),
                               "Use one of: halt, continue, rollback");
            }
            step.on_error = policy.value();
        }
        steps.push_back(std::move(step));
    }
    return steps;
}

core::errors::Result<std::vector<BatchOperation>> parse_batch(const json& raw) {
    const auto it = raw.find("batch_operations");
    if (it == raw.end() || !it->is_array()) {
        return invalid("Mode requires a 'batch_operations' array",
                       "Provide batch_operations: [{file_path, operation_type, parameters?}]");
    }

    std::vector<BatchOperation> operations;
    operations.reserve(it->size());
    for (std::size_t i = 0; i < it->size(); ++i) {
        const json& entry = (*it)[i];
        const std::string where = "batch_operations[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            return invalid(where + " must be an object");
        }

        const auto file_path = entry.find("file_path");
        const auto operation_type = entry.find("operation_type");
        if (file_path == entry.end() || !file_path->is_string()) {
            return invalid(where + ".file_path must be a string");
        }
        if (operation_type == entry.end() || !operation_type->is_string()) {
            return invalid(where + ".operation_type must be a string");
        }

        BatchOperation operation;
        operation.file_path = file_path->get<std::string>();
        operation.operation_type = operation_type->get<std::string>();
        const auto parameters = entry.find("parameters");
        if (parameters != entry.end() && !parameters->is_null()) {
            operation.parameters = *parameters;
        }
        operations.push_back(std::move(operation));
    }
    return operations;
}

}  // namespace

core::errors::Result<WorkflowRequest> validate_request(
    const json& raw, const core::config::EngineConfig& config) {
    if (!raw.is_object()) {
        return invalid("Workflow request must be a JSON object");
    }

    const auto mode_it = raw.find("mode");
    if (mode_it == raw.end() || !mode_it->is_string()) {
        return WorkflowError{ErrorCategory::Input, "Request does not name a mode",
                             core::errors::kUnknownCommand,
                             "Set mode to pipeline, batch or hybrid"};
    }
    const auto mode = protocol::parse_execution_mode(mode_it->get<std::string>());
    if (!mode.has_value()) {
        return WorkflowError{ErrorCategory::Input,
                             "Unknown workflow mode: " + mode_it->get<std::string>(),
                             core::errors::kUnknownCommand,
                             "Set mode to pipeline, batch or hybrid"};
    }

    WorkflowRequest request;
    request.mode = mode.value();
    request.execution_options.atomic = config.default_atomic;
    request.execution_options.max_parallel = config.default_max_parallel;
    request.error_handling.max_failures = config.default_max_failures;

    const auto options_it = raw.find("execution_options");
    if (options_it != raw.end() && !options_it->is_null()) {
        if (!options_it->is_object()) {
            return invalid("execution_options must be an object");
        }
        const auto atomic = options_it->find("atomic");
        if (atomic != options_it->end() && !atomic->is_null()) {
            if (!atomic->is_boolean()) {
                return invalid("execution_options.atomic must be a boolean");
            }
            request.execution_options.atomic = atomic->get<bool>();
        }

        auto max_parallel = read_count(*options_it, "max_parallel",
                                       request.execution_options.max_parallel,
                                       config.max_parallel_limit);
        if (core::errors::is_error(max_parallel)) {
            return core::errors::get_error(max_parallel);
        }
        request.execution_options.max_parallel = core::errors::get_value(max_parallel);
    }

    const auto handling_it = raw.find("error_handling");
    if (handling_it != raw.end() && !handling_it->is_null()) {
        if (!handling_it->is_object()) {
            return invalid("error_handling must be an object");
        }
        auto max_failures = read_count(*handling_it, "max_failures",
                                       request.error_handling.max_failures,
                                       std::numeric_limits<std::size_t>::max());
        if (core::errors::is_error(max_failures)) {
            return core::errors::get_error(max_failures);
        }
        request.error_handling.max_failures = core::errors::get_value(max_failures);
    }

    if (request.mode == ExecutionMode::Pipeline || request.mode == ExecutionMode::Hybrid) {
        auto steps = parse_pipeline(raw);
        if (core::errors::is_error(steps)) {
            return core::errors::get_error(steps);
        }
        request.pipeline = core::errors::get_value(steps);
    }

    if (request.mode == ExecutionMode::Batch || request.mode == ExecutionMode::Hybrid) {
        auto operations = parse_batch(raw);
        if (core::errors::is_error(operations)) {
            return core::errors::get_error(operations);
        }
        request.batch_operations = core::errors::get_value(operations);
    }

    return request;
}

}  // namespace wfproc::runtime
