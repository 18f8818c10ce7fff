#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "app/request_loader.hpp"
#include "core/config/workflow_id.hpp"
#include "core/errors/workflow_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/workflow_request.hpp"
#include "runtime/request_validator.hpp"
#include "runtime/result_aggregator.hpp"
#include "runtime/workflow_processor.hpp"
#include "tools/tool_host.hpp"

namespace {

    // Invalid UTF-8 from tool output is printed as U+FFFD rather than aborting.
    std::string render(const nlohmann::json& payload) {
        return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries the JSON response only.
    auto& logger = wfproc::core::logging::Logger::get();
    logger.set_sink(std::cerr);
    logger.set_workflow_id(wfproc::core::config::generate_workflow_id());

    auto parsed = wfproc::app::cli::parse_and_validate(argc, argv);
    if (wfproc::core::errors::is_error(parsed)) {
        const auto& err = wfproc::core::errors::get_error(parsed);
        WFPROC_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            WFPROC_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = wfproc::core::errors::get_value(parsed);
    logger.set_min_level(options.log_level);

    auto loaded = wfproc::app::load_request(options.request_source, std::cin);
    if (wfproc::core::errors::is_error(loaded)) {
        const auto& err = wfproc::core::errors::get_error(loaded);
        WFPROC_LOG_ERROR("Failed to load request [" + err.code + "]: " + err.message);
        return 3;
    }
    const auto& request_json = wfproc::core::errors::get_value(loaded);

    if (options.command == wfproc::app::cli::CliCommand::Validate) {
        auto validated = wfproc::runtime::validate_request(request_json, options.engine);
        if (wfproc::core::errors::is_error(validated)) {
            const auto& err = wfproc::core::errors::get_error(validated);
            std::cout << render(wfproc::runtime::build_error_response(err)) << std::endl;
            return 2;
        }
        const auto& request = wfproc::core::errors::get_value(validated);
        nlohmann::json summary;
        summary["valid"] = true;
        summary["mode"] = wfproc::protocol::to_string(request.mode);
        summary["pipeline_steps"] = request.pipeline ? request.pipeline->size() : 0;
        summary["batch_operations"] =
            request.batch_operations ? request.batch_operations->size() : 0;
        std::cout << render(summary) << std::endl;
        return 0;
    }

    WFPROC_LOG_INFO("Workspace: " + options.working_directory.string());
    wfproc::tools::ToolHost tool_host(options.working_directory);
    const wfproc::runtime::WorkflowProcessor processor(tool_host, options.engine);

    const nlohmann::json response = processor.execute(request_json);
    std::cout << render(response) << std::endl;

    if (response.contains("error")) {
        const std::string code = response.value("error_code", std::string());
        return code == wfproc::core::errors::kUnknownCommand ||
                       code == wfproc::core::errors::kInvalidParameters
                   ? 2
                   : 1;
    }
    return response.value("success", false) ? 0 : 1;
}
