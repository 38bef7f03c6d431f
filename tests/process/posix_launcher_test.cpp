#include "cloudsync/process/posix_launcher.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace cloudsync;
using namespace cloudsync::process;

namespace {

ProcessRequest shell(const std::string& script) {
    ProcessRequest request;
    request.program = "/bin/sh";
    request.args = {"-c", script};
    return request;
}

} // namespace

class PosixLauncherTest : public ::testing::Test {
protected:
    Result<ProcessResult> run(ProcessRequest request, ProcessCallbacks callbacks = {}) {
        std::optional<Result<ProcessResult>> outcome;
        launcher_.launch(std::move(request), std::move(callbacks),
                         [&outcome](Result<ProcessResult> r) { outcome.emplace(std::move(r)); });
        io_context_.run();
        io_context_.restart();
        EXPECT_TRUE(outcome.has_value());
        if (!outcome) {
            return Err<ProcessResult>(ErrorCode::Io, "no completion");
        }
        return std::move(*outcome);
    }

    boost::asio::io_context io_context_;
    PosixProcessLauncher launcher_{io_context_};
};

TEST_F(PosixLauncherTest, CapturesBothStreams) {
    std::string streamed_out;
    std::string streamed_err;
    ProcessCallbacks callbacks;
    callbacks.on_stdout = [&](std::string_view chunk) { streamed_out.append(chunk); };
    callbacks.on_stderr = [&](std::string_view chunk) { streamed_err.append(chunk); };

    auto result = run(shell("echo hello; echo oops >&2"), callbacks);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().exit_code, 0);
    EXPECT_EQ(result.value().stdout_text, "hello\n");
    EXPECT_EQ(result.value().stderr_text, "oops\n");
    EXPECT_EQ(streamed_out, "hello\n");
    EXPECT_EQ(streamed_err, "oops\n");
}

TEST_F(PosixLauncherTest, ArgumentsAreNotShellInterpreted) {
    ProcessRequest request;
    request.program = "/bin/echo";
    request.args = {"$HOME; rm -rf /tmp/nothing", "two"};

    auto result = run(request);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().stdout_text, "$HOME; rm -rf /tmp/nothing two\n");
}

TEST_F(PosixLauncherTest, DisallowedExitCodeFails) {
    auto result = run(shell("echo bad things >&2; exit 3"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ProcessFailed);
    EXPECT_EQ(result.error().message, "/bin/sh exited with code 3: bad things");
}

TEST_F(PosixLauncherTest, AllowedExitCodesSucceed) {
    auto request = shell("exit 1");
    request.allowed_exit_codes = {0, 1};

    auto result = run(request);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().exit_code, 1);
}

TEST_F(PosixLauncherTest, MissingProgramIsSpawnFailure) {
    ProcessRequest request;
    request.program = "/nonexistent/cloudsync-tool";

    bool spawned = false;
    ProcessCallbacks callbacks;
    callbacks.on_spawn = [&](std::shared_ptr<ProcessHandle>) { spawned = true; };

    auto result = run(request, callbacks);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::SpawnFailed);
    EXPECT_FALSE(spawned);
}

TEST_F(PosixLauncherTest, TimeoutKillsTheProcess) {
    auto request = shell("exec sleep 10");
    request.timeout = std::chrono::milliseconds(150);

    auto started = std::chrono::steady_clock::now();
    auto result = run(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(result.error().message, "/bin/sh: timeout");
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST_F(PosixLauncherTest, TerminateReportsCancelled) {
    std::shared_ptr<ProcessHandle> handle;
    std::vector<std::string> order;
    ProcessCallbacks callbacks;
    callbacks.on_spawn = [&](std::shared_ptr<ProcessHandle> h) {
        order.push_back("spawn");
        handle = std::move(h);
    };
    callbacks.on_stdout = [&](std::string_view) {
        order.push_back("output");
        handle->terminate();
    };

    auto result = run(shell("echo ready; exec sleep 10"), callbacks);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    ASSERT_FALSE(order.empty());
    EXPECT_EQ(order.front(), "spawn");
    ASSERT_TRUE(handle);
    EXPECT_TRUE(handle->terminate_requested());
    EXPECT_GT(handle->pid(), 0);
}

TEST_F(PosixLauncherTest, StdinIsEmpty) {
    auto result = run(shell("cat; echo done"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().stdout_text, "done\n");
}
