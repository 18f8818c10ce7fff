#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace wfproc::protocol {

    // Name reported in the "tool" field of every response.
    inline constexpr const char* kEngineToolName = "workflow_processor";

    // What a built-in tool reports back before it is folded into a step output.
    struct ToolResult {
        std::string tool_name;
        bool success;
        nlohmann::json output;      // tool specific payload
        std::string error_message;  // stderr or failure reason
        double duration_ms;
    };

} // namespace wfproc::protocol
