#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace wfproc::app::cli {

    using namespace wfproc::core::errors;

    namespace {

        // Raw strings as typed on the command line, before validation.
        struct RawCliOptions {
            std::optional<std::string> request;
            std::optional<std::string> cwd;
            std::optional<std::string> max_parallel;
            std::optional<std::string> max_failures;
            std::optional<std::string> log_level;
        };

        const char* kUsage =
            "Usage: wfproc_cli run|validate --request <file|-> [--cwd DIR] "
            "[--max-parallel N] [--max-failures N] [--log-level debug|info|warn|error]";

        // Exception-free integer parsing with bounds.
        Result<std::size_t> parse_bounded(const std::string& flag, const std::string& text,
                                          std::size_t lo, std::size_t hi) {
            std::size_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return WorkflowError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < lo || value > hi) {
                return WorkflowError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                     "Must be between " + std::to_string(lo) + " and " + std::to_string(hi) + "."};
            }
            return value;
        }

    } // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return WorkflowError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliOptions options;
        const std::string command = argv[1];
        if (command == "run") {
            options.command = CliCommand::Run;
        } else if (command == "validate") {
            options.command = CliCommand::Validate;
        } else {
            return WorkflowError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: run, validate."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser phase: read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* slot = nullptr;
            if (args[i] == "--request") slot = &raw.request;
            else if (args[i] == "--cwd") slot = &raw.cwd;
            else if (args[i] == "--max-parallel") slot = &raw.max_parallel;
            else if (args[i] == "--max-failures") slot = &raw.max_failures;
            else if (args[i] == "--log-level") slot = &raw.log_level;
            else {
                return WorkflowError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }

            if (i + 1 >= args.size()) {
                return WorkflowError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *slot = args[++i];
        }

        // 2. Validator phase: enforce logic and bounds
        if (!raw.request.has_value() || raw.request->empty()) {
            return WorkflowError{ErrorCategory::Input, "Must provide --request", "missing_required_flag", kUsage};
        }
        options.request_source = raw.request.value();

        if (raw.max_parallel) {
            auto parsed = parse_bounded("--max-parallel", *raw.max_parallel, 1, options.engine.max_parallel_limit);
            if (is_error(parsed)) return get_error(parsed);
            options.engine.default_max_parallel = get_value(parsed);
        }

        if (raw.max_failures) {
            auto parsed = parse_bounded("--max-failures", *raw.max_failures, 1, 1000000);
            if (is_error(parsed)) return get_error(parsed);
            options.engine.default_max_failures = get_value(parsed);
        }

        if (raw.log_level) {
            const auto level = wfproc::core::logging::Logger::parse_level(*raw.log_level);
            if (!level.has_value()) {
                return WorkflowError{ErrorCategory::Input, "Unknown log level: " + *raw.log_level, "invalid_log_level", "Use debug, info, warn or error."};
            }
            options.log_level = level.value();
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return WorkflowError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return WorkflowError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            options.working_directory = std::move(canonical_path);
        }

        return options;
    }

} // namespace wfproc::app::cli
