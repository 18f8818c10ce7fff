#pragma once
#include <filesystem>
#include <string>
#include "core/config/engine_config.hpp"
#include "core/errors/workflow_errors.hpp"
#include "core/logging/logger.hpp"

namespace wfproc::app::cli {

    enum class CliCommand {
        Run,
        Validate
    };

    struct CliOptions {
        CliCommand command = CliCommand::Run;
        std::string request_source;  // file path, or "-" for stdin
        std::filesystem::path working_directory = std::filesystem::current_path();
        wfproc::core::config::EngineConfig engine;
        wfproc::core::logging::LogLevel log_level = wfproc::core::logging::LogLevel::INFO;
    };

    wfproc::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
