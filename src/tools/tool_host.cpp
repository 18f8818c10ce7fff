#include "tools/tool_host.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <fstream>
#include <limits>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <type_traits>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace wfproc::tools {

using core::errors::ErrorCategory;
using core::errors::WorkflowError;
using nlohmann::json;
using protocol::ToolResult;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

double elapsed_ms_since(const std::chrono::steady_clock::time_point started) {
    const auto ended = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(ended - started).count();
}

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

// Reads the whole file. Returns false when it cannot be opened or read.
bool slurp(const std::filesystem::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return false;
    }
    out = buffer.str();
    return true;
}

bool spill(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << content;
    return out.good();
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

core::errors::Result<ProcessCapture> run_shell_command(
    const std::string& command, const std::filesystem::path& cwd,
    const std::uint32_t timeout_ms) {
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return WorkflowError{ErrorCategory::Internal,
                             "Failed to create process pipes.",
                             "pipe_creation_failed"};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        return WorkflowError{ErrorCategory::Internal,
                             "Failed to create process pipes.",
                             "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        return WorkflowError{ErrorCategory::Internal, "Failed to fork process.",
                             "fork_failed"};
    }

    if (pid == 0) {
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    capture.duration_ms = elapsed_ms_since(started);
    return capture;
}

core::errors::Result<std::string> require_string(const json& params,
                                                 const std::string& key,
                                                 const std::string& tool_name) {
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return WorkflowError{ErrorCategory::Input,
                             tool_name + " requires string parameter '" + key + "'",
                             "invalid_tool_params"};
    }
    return it->get<std::string>();
}

template <typename T>
core::errors::Result<T> optional_field(const json& params, const std::string& key,
                                       T fallback, const std::string& tool_name) {
    const auto it = params.find(key);
    if (it == params.end()) {
        return fallback;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) {
            return it->get<std::string>();
        }
    } else {
        if (it->is_number_unsigned() ||
            (it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
            const auto wide = it->get<std::uint64_t>();
            if (wide <= static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                return static_cast<T>(wide);
            }
        }
    }
    return WorkflowError{ErrorCategory::Input,
                         tool_name + " has an invalid value for '" + key + "'",
                         "invalid_tool_params"};
}

// Folds a typed tool result into what the engine records as step output.
core::errors::Result<json> to_step_output(
    const core::errors::Result<ToolResult>& result) {
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& tool_result = core::errors::get_value(result);
    if (!tool_result.success) {
        return WorkflowError{ErrorCategory::Execution, tool_result.error_message,
                             tool_result.tool_name + "_failed"};
    }
    return tool_result.output;
}

}  // namespace

ToolHost::ToolHost(std::filesystem::path workspace_root,
                   policy::CommandPolicy command_policy)
    : policy_guard_(std::move(workspace_root), std::move(command_policy)) {}

core::errors::Result<ToolResult> ToolHost::read_file(
    const std::filesystem::path& path) const {
    const auto started = std::chrono::steady_clock::now();
    auto resolved = policy_guard_.admit_path(path, policy::PathIntent::Read);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return ToolResult{"read_file", false, nullptr,
                          "File does not exist: " + file_path.string(), 0.0};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ToolResult{"read_file", false, nullptr,
                          "Path is not a regular file: " + file_path.string(), 0.0};
    }
    if (is_probably_binary(file_path)) {
        return ToolResult{"read_file", false, nullptr,
                          "Refusing to read binary file: " + file_path.string(), 0.0};
    }

    std::string content;
    if (!slurp(file_path, content)) {
        return ToolResult{"read_file", false, nullptr,
                          "I/O error while reading file: " + file_path.string(), 0.0};
    }

    json output;
    output["path"] = file_path.string();
    output["bytes"] = content.size();
    output["content"] = std::move(content);
    return ToolResult{"read_file", true, std::move(output), "",
                      elapsed_ms_since(started)};
}

core::errors::Result<ToolResult> ToolHost::write_file(
    const WriteRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    auto resolved = policy_guard_.admit_path(request.path, policy::PathIntent::Modify);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    const bool existed = std::filesystem::exists(file_path, ec) && !ec;
    json previous = nullptr;
    if (existed) {
        std::string prior;
        if (!slurp(file_path, prior)) {
            return ToolResult{"write_file", false, nullptr,
                              "Failed to read existing file: " + file_path.string(),
                              0.0};
        }
        previous = std::move(prior);
    }

    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return ToolResult{"write_file", false, nullptr,
                          "Failed to create parent directory: " +
                              file_path.parent_path().string(),
                          0.0};
    }
    if (!spill(file_path, request.content)) {
        return ToolResult{"write_file", false, nullptr,
                          "Failed to write file: " + file_path.string(), 0.0};
    }

    json output;
    output["path"] = file_path.string();
    output["bytes_written"] = request.content.size();
    output["created"] = !existed;
    output["previous_content"] = std::move(previous);
    return ToolResult{"write_file", true, std::move(output), "",
                      elapsed_ms_since(started)};
}

core::errors::Result<ToolResult> ToolHost::delete_file(
    const std::filesystem::path& path) const {
    const auto started = std::chrono::steady_clock::now();
    auto resolved = policy_guard_.admit_path(path, policy::PathIntent::Modify);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ToolResult{"delete_file", false, nullptr,
                          "File does not exist: " + file_path.string(), 0.0};
    }

    std::string prior;
    if (!slurp(file_path, prior)) {
        return ToolResult{"delete_file", false, nullptr,
                          "Failed to read file before delete: " + file_path.string(),
                          0.0};
    }
    if (!std::filesystem::remove(file_path, ec) || ec) {
        return ToolResult{"delete_file", false, nullptr,
                          "Failed to delete file: " + file_path.string(), 0.0};
    }

    json output;
    output["path"] = file_path.string();
    output["previous_content"] = std::move(prior);
    return ToolResult{"delete_file", true, std::move(output), "",
                      elapsed_ms_since(started)};
}

core::errors::Result<ToolResult> ToolHost::search(const SearchRequest& request) const {
    if (request.pattern.empty()) {
        return WorkflowError{ErrorCategory::Input, "Search pattern cannot be empty.",
                             "empty_search_pattern"};
    }
    if (request.max_matches == 0) {
        return WorkflowError{ErrorCategory::Input,
                             "max_matches must be greater than zero.",
                             "invalid_search_limit"};
    }

    const auto started = std::chrono::steady_clock::now();
    auto resolved = policy_guard_.admit_path(request.scope, policy::PathIntent::Scan);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path scope_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(scope_path, ec) || ec) {
        return ToolResult{"search", false, nullptr,
                          "Scope does not exist: " + scope_path.string(), 0.0};
    }

    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
        files.push_back(scope_path);
    } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (const auto& entry :
             std::filesystem::recursive_directory_iterator(scope_path, options, ec)) {
            if (!entry.is_regular_file(ec) || ec) {
                continue;
            }
            files.push_back(entry.path());
        }
    } else {
        return ToolResult{"search", false, nullptr,
                          "Scope is neither a file nor directory: " + scope_path.string(),
                          0.0};
    }

    constexpr std::uintmax_t kMaxFileBytes = 1024 * 1024;
    json lines = json::array();
    for (const auto& file : files) {
        if (lines.size() >= request.max_matches) {
            break;
        }

        const auto size = std::filesystem::file_size(file, ec);
        if (ec || size > kMaxFileBytes || is_probably_binary(file)) {
            continue;
        }

        std::ifstream in(file);
        if (!in.is_open()) {
            continue;
        }

        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.find(request.pattern) == std::string::npos) {
                continue;
            }
            lines.push_back(file.string() + ":" + std::to_string(line_no) + ":" +
                            trim_line(line));
            if (lines.size() >= request.max_matches) {
                break;
            }
        }
    }

    json output;
    output["pattern"] = request.pattern;
    output["scope"] = scope_path.string();
    output["matches"] = lines.size();
    output["lines"] = std::move(lines);
    return ToolResult{"search", true, std::move(output), "", elapsed_ms_since(started)};
}

core::errors::Result<ToolResult> ToolHost::run_command(
    const CommandRequest& request) const {
    auto validated_command = policy_guard_.admit_command(request.command);
    if (core::errors::is_error(validated_command)) {
        return core::errors::get_error(validated_command);
    }

    auto validated_cwd =
        policy_guard_.admit_path(request.working_directory, policy::PathIntent::RunIn);
    if (core::errors::is_error(validated_cwd)) {
        return core::errors::get_error(validated_cwd);
    }

    auto capture_result = run_shell_command(core::errors::get_value(validated_command),
                                            core::errors::get_value(validated_cwd),
                                            request.timeout_ms);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    ToolResult result;
    result.tool_name = "run_command";
    result.duration_ms = capture.duration_ms;
    result.output = json{{"exit_code", capture.exit_code},
                         {"stdout", capture.stdout_text},
                         {"stderr", capture.stderr_text}};
    result.error_message = capture.stderr_text;

    if (capture.timed_out) {
        result.success = false;
        if (!result.error_message.empty()) {
            result.error_message += "\n";
        }
        result.error_message += "Command timed out.";
        return result;
    }

    result.success = (capture.exit_code == 0);
    if (!result.success && result.error_message.empty()) {
        result.error_message =
            "Command failed with exit code " + std::to_string(capture.exit_code);
    }
    return result;
}

core::errors::Result<json> ToolHost::invoke(const std::string& tool_name,
                                            const json& params) {
    if (!params.is_object()) {
        return WorkflowError{ErrorCategory::Input,
                             "Parameters for " + tool_name + " must be an object.",
                             "invalid_tool_params"};
    }
    WFPROC_LOG_DEBUG("ToolHost: invoking " + tool_name);

    if (tool_name == "read_file") {
        auto path = require_string(params, "path", tool_name);
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        return to_step_output(read_file(core::errors::get_value(path)));
    }

    if (tool_name == "write_file") {
        auto path = require_string(params, "path", tool_name);
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        auto content = require_string(params, "content", tool_name);
        if (core::errors::is_error(content)) {
            return core::errors::get_error(content);
        }
        WriteRequest request;
        request.path = core::errors::get_value(path);
        request.content = core::errors::get_value(content);
        return to_step_output(write_file(request));
    }

    if (tool_name == "delete_file") {
        auto path = require_string(params, "path", tool_name);
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        return to_step_output(delete_file(core::errors::get_value(path)));
    }

    if (tool_name == "search") {
        auto pattern = require_string(params, "pattern", tool_name);
        if (core::errors::is_error(pattern)) {
            return core::errors::get_error(pattern);
        }
        auto scope = optional_field<std::string>(params, "scope", ".", tool_name);
        if (core::errors::is_error(scope)) {
            return core::errors::get_error(scope);
        }
        auto max_matches =
            optional_field<std::size_t>(params, "max_matches", 20, tool_name);
        if (core::errors::is_error(max_matches)) {
            return core::errors::get_error(max_matches);
        }
        SearchRequest request;
        request.pattern = core::errors::get_value(pattern);
        request.scope = core::errors::get_value(scope);
        request.max_matches = core::errors::get_value(max_matches);
        return to_step_output(search(request));
    }

    if (tool_name == "run_command") {
        auto command = require_string(params, "command", tool_name);
        if (core::errors::is_error(command)) {
            return core::errors::get_error(command);
        }
        auto cwd = optional_field<std::string>(params, "cwd", ".", tool_name);
        if (core::errors::is_error(cwd)) {
            return core::errors::get_error(cwd);
        }
        auto timeout_ms =
            optional_field<std::uint32_t>(params, "timeout_ms", 5000, tool_name);
        if (core::errors::is_error(timeout_ms)) {
            return core::errors::get_error(timeout_ms);
        }
        CommandRequest request;
        request.command = core::errors::get_value(command);
        request.working_directory = core::errors::get_value(cwd);
        request.timeout_ms = core::errors::get_value(timeout_ms);
        return to_step_output(run_command(request));
    }

    return WorkflowError{ErrorCategory::Input, "Unknown tool: " + tool_name,
                         "unknown_tool",
                         "Known tools: read_file, write_file, delete_file, search, run_command"};
}

core::errors::Result<json> ToolHost::invoke_operation(const std::string& file_path,
                                                      const std::string& operation_type,
                                                      const json& parameters) {
    json params = parameters.is_object() ? parameters : json::object();

    std::string tool_name;
    if (operation_type == "read") {
        tool_name = "read_file";
        params["path"] = file_path;
    } else if (operation_type == "write") {
        tool_name = "write_file";
        params["path"] = file_path;
    } else if (operation_type == "delete") {
        tool_name = "delete_file";
        params["path"] = file_path;
    } else if (operation_type == "search") {
        tool_name = "search";
        params["scope"] = file_path;
    } else {
        return WorkflowError{ErrorCategory::Input,
                             "Unknown operation type: " + operation_type,
                             "unknown_operation",
                             "Known operations: read, write, delete, search"};
    }

    return invoke(tool_name, params);
}

bool ToolHost::supports_undo(const std::string& tool_name) const {
    return tool_name == "write_file" || tool_name == "delete_file";
}

core::errors::Result<json> ToolHost::undo(const std::string& tool_name,
                                          const json& params, const json& output) {
    static_cast<void>(params);
    if (!supports_undo(tool_name)) {
        return ToolDispatcher::undo(tool_name, params, output);
    }
    if (!output.is_object() || !output.contains("path") || !output["path"].is_string()) {
        return WorkflowError{ErrorCategory::Internal,
                             "Cannot undo " + tool_name + " without its recorded output.",
                             "undo_state_missing"};
    }

    const std::filesystem::path file_path = output["path"].get<std::string>();
    std::error_code ec;

    if (tool_name == "write_file" && output.value("created", false)) {
        std::filesystem::remove(file_path, ec);
        if (ec) {
            return WorkflowError{ErrorCategory::Execution,
                                 "Failed to remove created file: " + file_path.string(),
                                 "undo_failed"};
        }
        WFPROC_LOG_INFO("ToolHost: undo removed " + file_path.string());
        return json{{"path", file_path.string()}, {"restored", false}};
    }

    const auto previous = output.find("previous_content");
    if (previous == output.end() || !previous->is_string()) {
        return WorkflowError{ErrorCategory::Internal,
                             "No previous content recorded for " + file_path.string(),
                             "undo_state_missing"};
    }
    if (!spill(file_path, previous->get<std::string>())) {
        return WorkflowError{ErrorCategory::Execution,
                             "Failed to restore file: " + file_path.string(),
                             "undo_failed"};
    }
    WFPROC_LOG_INFO("ToolHost: undo restored " + file_path.string());
    return json{{"path", file_path.string()}, {"restored", true}};
}

}  // namespace wfproc::tools
