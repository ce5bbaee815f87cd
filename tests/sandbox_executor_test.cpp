#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

#include "sandbox/exec_environment.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "sandbox/sandbox_wrapper.hpp"
#include "test_support.hpp"

namespace {

using namespace rampart::sandbox;

// Marks wrapped commands through the environment so tests can tell whether
// wrapping happened.
class MarkingWrapper : public SandboxWrapper {
public:
    std::string Name() const override { return "marking"; }
    bool IsSupported() const override { return true; }
    WrappedCommand Wrap(const std::string& command, const std::filesystem::path& /*cwd*/) override {
        auto wrapped = ShellCommand(command);
        wrapped.env["RAMPART_WRAPPED"] = "yes";
        return wrapped;
    }
};

class SandboxExecutorTest : public ::testing::Test {
protected:
    ExecutorOptions Options() const {
        ExecutorOptions options;
        options.home_dir = dir_.Path() / "home";
        options.grace_period = std::chrono::milliseconds(500);
        return options;
    }

    CommandExecutionRequest Request(const std::string& command) const {
        CommandExecutionRequest request;
        request.command = command;
        request.working_dir = dir_.Path();
        return request;
    }

    rampart::testing::TempDir dir_;
};

TEST_F(SandboxExecutorTest, CapturesStdoutStderrAndExitCode) {
    const SandboxExecutor executor(Options());
    const auto ok = executor.Run(Request("echo hello; echo oops 1>&2"));
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.stdout_text, "hello");
    EXPECT_EQ(ok.stderr_text, "oops");
    ASSERT_TRUE(ok.exit_code.has_value());
    EXPECT_EQ(*ok.exit_code, 0);
    EXPECT_FALSE(ok.sandboxed);
    EXPECT_FALSE(ok.error.has_value());

    const auto failed = executor.Run(Request("exit 3"));
    EXPECT_FALSE(failed.success);
    ASSERT_TRUE(failed.exit_code.has_value());
    EXPECT_EQ(*failed.exit_code, 3);
    EXPECT_EQ(failed.error.value_or(""), "Command exited with code 3");
}

TEST_F(SandboxExecutorTest, RunsInWorkingDirectory) {
    const SandboxExecutor executor(Options());
    const auto result = executor.Run(Request("touch marker.txt"));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(std::filesystem::exists(dir_.Path() / "marker.txt"));
}

TEST_F(SandboxExecutorTest, StreamsChunksInOrder) {
    const SandboxExecutor executor(Options());
    OutputChannel events;
    const auto result = executor.Run(Request("echo one; sleep 0.05; echo two; sleep 0.05; echo three"), &events);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(events.IsClosed());

    std::string streamed;
    OutputEvent event;
    while (events.Consume(event)) {
        EXPECT_EQ(event.stream, OutputStream::kStdout);
        streamed += event.chunk;
    }
    EXPECT_EQ(streamed, "one\ntwo\nthree\n");
}

TEST_F(SandboxExecutorTest, ConsumerSeesOutputWhileCommandRuns) {
    const SandboxExecutor executor(Options());
    OutputChannel events;
    const auto request = Request("echo early; sleep 1; echo late");
    CommandExecutionResult result;
    std::thread runner([&]() { result = executor.Run(request, &events); });

    OutputEvent first;
    ASSERT_TRUE(events.Consume(first));
    EXPECT_EQ(first.chunk, "early\n");
    EXPECT_FALSE(events.IsClosed());
    runner.join();
    EXPECT_TRUE(result.success);
}

TEST_F(SandboxExecutorTest, CancellationTerminatesProcessGroup) {
    const SandboxExecutor executor(Options());
    auto request = Request("sleep 30");
    CommandExecutionResult result;
    const auto started = std::chrono::steady_clock::now();
    std::thread runner([&]() { result = executor.Run(request); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    request.cancel.Cancel();
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_TRUE(result.killed);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Command was cancelled");
}

TEST_F(SandboxExecutorTest, BufferCapLimitsAccumulationNotStreaming) {
    auto options = Options();
    options.max_buffer = 100;
    const SandboxExecutor executor(options);
    OutputChannel events;
    const auto result = executor.Run(Request("head -c 1000 /dev/zero | tr '\\0' a"), &events);
    ASSERT_TRUE(result.success);
    EXPECT_LE(result.stdout_text.size(), 100u);

    std::size_t streamed = 0;
    OutputEvent event;
    while (events.Consume(event)) {
        streamed += event.chunk.size();
    }
    EXPECT_EQ(streamed, 1000u);
}

TEST_F(SandboxExecutorTest, WrapperAppliesOnlyWhenSandboxRequested) {
    MarkingWrapper wrapper;
    const SandboxExecutor executor(Options(), &wrapper);
    EXPECT_TRUE(executor.HasSandbox());

    const auto wrapped = executor.Run(Request("echo ${RAMPART_WRAPPED:-no}"));
    EXPECT_TRUE(wrapped.sandboxed);
    EXPECT_EQ(wrapped.stdout_text, "yes");

    auto request = Request("echo ${RAMPART_WRAPPED:-no}");
    request.sandbox = false;
    const auto plain = executor.Run(request);
    EXPECT_FALSE(plain.sandboxed);
    EXPECT_EQ(plain.stdout_text, "no");
}

TEST_F(SandboxExecutorTest, SandboxedFailuresAreAnnotated) {
    MarkingWrapper wrapper;
    const SandboxExecutor executor(Options(), &wrapper);
    const auto result = executor.Run(Request("echo 'touch: Read-only file system' 1>&2; exit 1"));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.stderr_text.find("<sandbox_violations>"), std::string::npos);
    EXPECT_EQ(result.stderr_text.rfind("touch: Read-only file system", 0), 0u);

    const auto unrelated = executor.Run(Request("echo 'syntax error' 1>&2; exit 2"));
    EXPECT_EQ(unrelated.stderr_text, "syntax error");
}

TEST(AnnotateSandboxFailureTest, ClassifiesDenials) {
    EXPECT_NE(AnnotateSandboxFailure("curl: (6) Could not resolve host: x").find("Network access was blocked"),
              std::string::npos);
    EXPECT_NE(AnnotateSandboxFailure("mkdir: Permission denied").find("Access was denied"), std::string::npos);
    EXPECT_EQ(AnnotateSandboxFailure("plain failure"), "plain failure");
}

TEST(ToJsonTest, NullsAbsentFields) {
    CommandExecutionResult result;
    result.killed = true;
    result.signal = "SIGTERM";
    result.error = "Command was cancelled";
    const auto json = ToJson(result);
    EXPECT_TRUE(json["exitCode"].is_null());
    EXPECT_EQ(json["signal"], "SIGTERM");
    EXPECT_EQ(json["error"], "Command was cancelled");
    EXPECT_FALSE(json["success"].get<bool>());
}

TEST(ExecEnvironmentTest, PrependsExistingToolchainDirectories) {
    rampart::testing::TempDir home;
    std::filesystem::create_directories(home.Path() / ".cargo" / "bin");
    std::filesystem::create_directories(home.Path() / ".nvm" / "versions" / "node" / "v9.11.0" / "bin");
    std::filesystem::create_directories(home.Path() / ".nvm" / "versions" / "node" / "v20.1.0" / "bin");
    std::filesystem::create_directories(home.Path() / ".nvm" / "versions" / "node" / "v18.20.4" / "bin");

    EXPECT_EQ(NewestNvmNodeBin(home.Path()), home.Path() / ".nvm" / "versions" / "node" / "v20.1.0" / "bin");

    const std::string cargo = (home.Path() / ".cargo" / "bin").string();
    const auto path = BuildAugmentedPath(home.Path(), "/usr/bin:" + cargo);
    EXPECT_NE(path.find((home.Path() / ".nvm" / "versions" / "node" / "v20.1.0" / "bin").string()),
              std::string::npos);
    EXPECT_EQ(path.find((home.Path() / ".volta" / "bin").string()), std::string::npos);
    // Entries already on PATH are not repeated.
    EXPECT_EQ(path.find(cargo), path.rfind(cargo));
    EXPECT_EQ(path.substr(path.size() - cargo.size() - 9), "/usr/bin:" + cargo);
}

TEST(ExecEnvironmentTest, NoNvmInstallYieldsEmptyPath) {
    rampart::testing::TempDir home;
    EXPECT_TRUE(NewestNvmNodeBin(home.Path()).empty());
}

TEST(BubblewrapWrapperTest, FilesystemArgsMaskSecretsAndBindWritableRoots) {
    rampart::testing::TempDir home;
    home.Write(".ssh/id_rsa", "secret");
    std::filesystem::create_directories(home.Path() / ".cache");
    const BubblewrapWrapper wrapper(SandboxPolicy::Baseline(home.Path()), "/nonexistent/bwrap", std::nullopt);
    const auto args = wrapper.FilesystemArgs();

    const auto has_triple = [&](const std::string& a, const std::string& b, const std::string& c) {
        for (std::size_t i = 0; i + 2 < args.size(); ++i) {
            if (args[i] == a && args[i + 1] == b && args[i + 2] == c) {
                return true;
            }
        }
        return false;
    };
    const auto key = (home.Path() / ".ssh" / "id_rsa").string();
    const auto cache = (home.Path() / ".cache").string();
    EXPECT_TRUE(has_triple("--ro-bind", "/", "/"));
    EXPECT_TRUE(has_triple("--ro-bind", "/dev/null", key));
    EXPECT_TRUE(has_triple("--bind", cache, cache));
    EXPECT_TRUE(wrapper.IsSupported());
}

}  // namespace
