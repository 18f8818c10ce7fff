#pragma once
#include <string>
#include <variant>

namespace wfproc::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // Malformed request or CLI flag
        Execution,  // A tool failed to do its work
        Policy,     // A path or command was rejected by the policy guard
        Internal    // Engine bug or resource exhaustion
    };

    // Request-level error codes surfaced to callers
    inline constexpr const char* kUnknownCommand = "unknown_command";
    inline constexpr const char* kInvalidParameters = "invalid_parameters";

    // The standardized error payload
    struct WorkflowError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds a value of type T OR a WorkflowError.
    template <typename T>
    using Result = std::variant<T, WorkflowError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<WorkflowError>(result);
    }

    template <typename T>
    const WorkflowError& get_error(const Result<T>& result) {
        return std::get<WorkflowError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Name reported in the "error" field of an error response.
    inline std::string error_name(const WorkflowError& error) {
        if (error.code == kUnknownCommand) {
            return "UnknownCommand";
        }
        if (error.code == kInvalidParameters) {
            return "InvalidParameters";
        }
        switch (error.category) {
            case ErrorCategory::Input:
                return "InvalidParameters";
            case ErrorCategory::Execution:
                return "ExecutionFailed";
            case ErrorCategory::Policy:
                return "PolicyViolation";
            case ErrorCategory::Internal:
            default:
                return "InternalError";
        }
    }

} // namespace wfproc::core::errors
