#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/output_channel.hpp"
#include "sandbox/sandbox_wrapper.hpp"

namespace rampart::sandbox {

struct CommandExecutionRequest {
    std::string command;
    std::filesystem::path working_dir;
    // false is reserved for commands that need unrestricted egress.
    bool sandbox = true;
    CancellationToken cancel;
};

struct CommandExecutionResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    bool killed = false;
    // Terminating signal name, e.g. "SIGTERM".
    std::optional<std::string> signal;
    bool sandboxed = false;
    std::optional<std::string> error;
};

struct ExecutorOptions {
    std::size_t max_buffer = 1024 * 1024;
    std::chrono::milliseconds grace_period{5000};
    std::chrono::milliseconds poll_interval{20};
    std::filesystem::path home_dir;
};

class SandboxExecutor {
public:
    // wrapper may be null, in which case every command runs unsandboxed.
    explicit SandboxExecutor(ExecutorOptions options, SandboxWrapper* wrapper = nullptr);

    // Never throws. Output chunks are published to events, when given, as they
    // arrive; the channel is closed before returning.
    CommandExecutionResult Run(const CommandExecutionRequest& request, OutputChannel* events = nullptr) const;

    const ExecutorOptions& Options() const { return options_; }
    bool HasSandbox() const { return wrapper_ != nullptr && wrapper_->IsSupported(); }

private:
    ExecutorOptions options_;
    SandboxWrapper* wrapper_;
};

nlohmann::json ToJson(const CommandExecutionResult& result);

}  // namespace rampart::sandbox
