#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/workflow_id.hpp"
#include "core/errors/workflow_errors.hpp"
#include "tools/tool_host.hpp"

namespace {

using nlohmann::json;
using wfproc::core::errors::get_error;
using wfproc::core::errors::get_value;
using wfproc::core::errors::is_error;
using wfproc::tools::CommandRequest;
using wfproc::tools::SearchRequest;
using wfproc::tools::ToolHost;
using wfproc::tools::WriteRequest;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_tool_host_" + wfproc::core::config::generate_workflow_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::string read_back(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TEST(ToolHostTest, ReadFileReturnsContent) {
    TempWorkspace workspace;
    write_file(workspace.root() / "notes.txt", "hello tool host");

    ToolHost host(workspace.root());
    auto result = host.read_file("notes.txt");
    ASSERT_FALSE(is_error(result));

    const auto& tool_result = get_value(result);
    EXPECT_TRUE(tool_result.success);
    EXPECT_EQ(tool_result.tool_name, "read_file");
    EXPECT_EQ(tool_result.output["content"].get<std::string>(), "hello tool host");
    EXPECT_EQ(tool_result.output["bytes"].get<std::size_t>(), 15u);
    EXPECT_TRUE(tool_result.error_message.empty());
}

TEST(ToolHostTest, ReadFileReportsMissingFile) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());
    auto result = host.read_file("absent.txt");
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).success);
    EXPECT_NE(get_value(result).error_message.find("does not exist"), std::string::npos);
}

TEST(ToolHostTest, ReadFileRejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside.txt";
    write_file(outside, "outside");

    ToolHost host(workspace.root());
    auto result = host.read_file(outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(ToolHostTest, WriteFileCreatesAndReportsPreviousContent) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    WriteRequest request;
    request.path = "out/new.txt";
    request.content = "first";
    auto created = host.write_file(request);
    ASSERT_FALSE(is_error(created));
    EXPECT_TRUE(get_value(created).success);
    EXPECT_TRUE(get_value(created).output["created"].get<bool>());
    EXPECT_TRUE(get_value(created).output["previous_content"].is_null());

    request.content = "second";
    auto replaced = host.write_file(request);
    ASSERT_FALSE(is_error(replaced));
    EXPECT_FALSE(get_value(replaced).output["created"].get<bool>());
    EXPECT_EQ(get_value(replaced).output["previous_content"].get<std::string>(), "first");
    EXPECT_EQ(read_back(workspace.root() / "out/new.txt"), "second");
}

TEST(ToolHostTest, WriteFileRejectsDirectoryTarget) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "dir");
    ToolHost host(workspace.root());

    WriteRequest request;
    request.path = "dir";
    request.content = "x";
    auto result = host.write_file(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_is_directory");
}

TEST(ToolHostTest, DeleteFileRemovesAndKeepsContent) {
    TempWorkspace workspace;
    write_file(workspace.root() / "doomed.txt", "bye");
    ToolHost host(workspace.root());

    auto result = host.delete_file("doomed.txt");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success);
    EXPECT_EQ(get_value(result).output["previous_content"].get<std::string>(), "bye");
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "doomed.txt"));
}

TEST(ToolHostTest, SearchFindsMatchesRecursively) {
    TempWorkspace workspace;
    write_file(workspace.root() / "a.cpp", "int needle = 1;\n");
    write_file(workspace.root() / "sub/b.cpp", "needle and more needle\n");
    write_file(workspace.root() / "sub/c.cpp", "no match here\n");

    ToolHost host(workspace.root());
    SearchRequest request;
    request.pattern = "needle";
    request.scope = ".";
    request.max_matches = 4;

    auto result = host.search(request);
    ASSERT_FALSE(is_error(result));
    const auto& tool_result = get_value(result);
    EXPECT_TRUE(tool_result.success);
    EXPECT_EQ(tool_result.tool_name, "search");
    EXPECT_EQ(tool_result.output["matches"].get<std::size_t>(), 2u);
    const std::string joined = tool_result.output["lines"].dump();
    EXPECT_NE(joined.find("a.cpp:1"), std::string::npos);
    EXPECT_NE(joined.find("b.cpp:1"), std::string::npos);
}

TEST(ToolHostTest, SearchReportsNoMatches) {
    TempWorkspace workspace;
    write_file(workspace.root() / "x.txt", "alpha beta gamma\n");

    ToolHost host(workspace.root());
    SearchRequest request;
    request.pattern = "needle";

    auto result = host.search(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).success);
    EXPECT_EQ(get_value(result).output["matches"].get<std::size_t>(), 0u);
    EXPECT_TRUE(get_value(result).output["lines"].empty());
}

TEST(ToolHostTest, SearchRejectsEmptyPattern) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());
    SearchRequest request;
    request.pattern = "";

    auto result = host.search(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_search_pattern");
}

TEST(ToolHostTest, RunCommandExecutesSuccessfully) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    CommandRequest request;
    request.command = "printf 'hello'";
    request.timeout_ms = 1000;

    auto result = host.run_command(request);
    ASSERT_FALSE(is_error(result));
    const auto& tool_result = get_value(result);
    EXPECT_TRUE(tool_result.success);
    EXPECT_EQ(tool_result.tool_name, "run_command");
    EXPECT_EQ(tool_result.output["stdout"].get<std::string>(), "hello");
    EXPECT_EQ(tool_result.output["exit_code"].get<int>(), 0);
}

TEST(ToolHostTest, RunCommandReportsNonZeroExit) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    CommandRequest request;
    request.command = "exit 3";
    auto result = host.run_command(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).success);
    EXPECT_EQ(get_value(result).output["exit_code"].get<int>(), 3);
    EXPECT_NE(get_value(result).error_message.find("exit code 3"), std::string::npos);
}

TEST(ToolHostTest, RunCommandRejectsBlockedOperation) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    CommandRequest request;
    request.command = "sudo ls";
    auto result = host.run_command(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "blocked_command");
}

TEST(ToolHostTest, RunCommandTimesOut) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    CommandRequest request;
    request.command = "sleep 1";
    request.timeout_ms = 30;

    auto result = host.run_command(request);
    ASSERT_FALSE(is_error(result));
    const auto& tool_result = get_value(result);
    EXPECT_FALSE(tool_result.success);
    EXPECT_NE(tool_result.error_message.find("timed out"), std::string::npos);
}

TEST(ToolHostTest, InvokeDispatchesByToolName) {
    TempWorkspace workspace;
    write_file(workspace.root() / "in.txt", "payload");
    ToolHost host(workspace.root());

    auto result = host.invoke("read_file", json{{"path", "in.txt"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"].get<std::string>(), "payload");
}

TEST(ToolHostTest, InvokeTurnsToolFailureIntoError) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    auto result = host.invoke("read_file", json{{"path", "missing.txt"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "read_file_failed");
}

TEST(ToolHostTest, InvokeValidatesParameters) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    auto missing = host.invoke("write_file", json{{"path", "a.txt"}});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_tool_params");

    auto wrong_type =
        host.invoke("search", json{{"pattern", "x"}, {"max_matches", "many"}});
    ASSERT_TRUE(is_error(wrong_type));
    EXPECT_EQ(get_error(wrong_type).code, "invalid_tool_params");
}

TEST(ToolHostTest, InvokeRejectsIntegersThatDoNotFit) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    // 2^32 + 100 would wrap to a 100 ms timeout; 2^32 would wrap to none.
    for (const unsigned long long timeout : {4294967396ULL, 4294967296ULL}) {
        auto result = host.invoke("run_command",
                                  json{{"command", "sleep 1"}, {"timeout_ms", timeout}});
        ASSERT_TRUE(is_error(result)) << timeout;
        EXPECT_EQ(get_error(result).code, "invalid_tool_params") << timeout;
    }

    auto negative = host.invoke("run_command",
                                json{{"command", "true"}, {"timeout_ms", -5}});
    ASSERT_TRUE(is_error(negative));
    EXPECT_EQ(get_error(negative).code, "invalid_tool_params");

    auto largest = host.invoke("run_command",
                               json{{"command", "true"}, {"timeout_ms", 4294967295ULL}});
    EXPECT_FALSE(is_error(largest));
}

TEST(ToolHostTest, RunCommandRequiresExistingWorkingDirectory) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    auto result = host.invoke("run_command", json{{"command", "true"}, {"cwd", "missing"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "not_a_directory");
}

TEST(ToolHostTest, NonUtf8OutputIsCarriedAsBytes) {
    TempWorkspace workspace;
    write_file(workspace.root() / "latin1.txt", "caf\xe9\n");
    ToolHost host(workspace.root());

    auto result = host.invoke("read_file", json{{"path", "latin1.txt"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result)["content"].get<std::string>(), "caf\xe9\n");
}

TEST(ToolHostTest, InvokeRejectsUnknownTool) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    auto result = host.invoke("teleport", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_tool");
}

TEST(ToolHostTest, InvokeOperationMapsOperationTypes) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    auto written = host.invoke_operation("batch/a.txt", "write", json{{"content", "A"}});
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(read_back(workspace.root() / "batch/a.txt"), "A");

    auto read = host.invoke_operation("batch/a.txt", "read", json::object());
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read)["content"].get<std::string>(), "A");

    auto found = host.invoke_operation("batch", "search", json{{"pattern", "A"}});
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found)["matches"].get<std::size_t>(), 1u);

    auto deleted = host.invoke_operation("batch/a.txt", "delete", json::object());
    ASSERT_FALSE(is_error(deleted));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "batch/a.txt"));
}

TEST(ToolHostTest, InvokeOperationRejectsUnknownType) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    auto result = host.invoke_operation("a.txt", "compress", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_operation");
}

TEST(ToolHostTest, UndoRestoresOverwrittenFile) {
    TempWorkspace workspace;
    write_file(workspace.root() / "keep.txt", "original");
    ToolHost host(workspace.root());

    const json params{{"path", "keep.txt"}, {"content", "changed"}};
    auto written = host.invoke("write_file", params);
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(read_back(workspace.root() / "keep.txt"), "changed");

    ASSERT_TRUE(host.supports_undo("write_file"));
    auto undone = host.undo("write_file", params, get_value(written));
    ASSERT_FALSE(is_error(undone));
    EXPECT_EQ(read_back(workspace.root() / "keep.txt"), "original");
}

TEST(ToolHostTest, UndoRemovesCreatedFile) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    const json params{{"path", "fresh.txt"}, {"content", "new"}};
    auto written = host.invoke("write_file", params);
    ASSERT_FALSE(is_error(written));

    auto undone = host.undo("write_file", params, get_value(written));
    ASSERT_FALSE(is_error(undone));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "fresh.txt"));
}

TEST(ToolHostTest, UndoRecreatesDeletedFile) {
    TempWorkspace workspace;
    write_file(workspace.root() / "gone.txt", "remember me");
    ToolHost host(workspace.root());

    const json params{{"path", "gone.txt"}};
    auto deleted = host.invoke("delete_file", params);
    ASSERT_FALSE(is_error(deleted));

    auto undone = host.undo("delete_file", params, get_value(deleted));
    ASSERT_FALSE(is_error(undone));
    EXPECT_EQ(read_back(workspace.root() / "gone.txt"), "remember me");
}

TEST(ToolHostTest, UndoIsUnavailableForReadOnlyTools) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    EXPECT_FALSE(host.supports_undo("read_file"));
    EXPECT_FALSE(host.supports_undo("run_command"));
    auto result = host.undo("read_file", json::object(), json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "undo_not_supported");
}

TEST(ToolHostTest, UndoRequiresRecordedOutput) {
    TempWorkspace workspace;
    ToolHost host(workspace.root());

    auto result = host.undo("write_file", json::object(), json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "undo_state_missing");
}

}  // namespace
