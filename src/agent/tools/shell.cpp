#include "agent/tools/shell.hpp"

#include <condition_variable>
#include <limits>
#include <mutex>
#include <thread>

#include "output/truncation.hpp"
#include "utils/logging.hpp"

namespace rampart::agent::tools {

RunCommandTool::RunCommandTool(security::SecurityBoundary boundary,
                               std::shared_ptr<const sandbox::SandboxExecutor> executor,
                               std::shared_ptr<const sandbox::CommandClassifier> classifier,
                               RunCommandOptions options)
    : boundary_(std::move(boundary))
    , executor_(std::move(executor))
    , classifier_(std::move(classifier))
    , options_(std::move(options)) {}

std::string RunCommandTool::Description() const {
    std::string timeout = "no";
    if (options_.timeout.count() > 0) {
        timeout = "a " + std::to_string(options_.timeout.count() / 1000) + "s";
    }
    return "Execute a bash command in a sandboxed environment with filesystem and network restrictions. "
           "The command runs with " + timeout + " timeout. Network access is limited to package "
           "registries and allowed APIs. Sensitive paths like ~/.ssh are protected. Set sandbox to "
           "false only when unrestricted network access is required; this needs user approval.";
}

nlohmann::json RunCommandTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {{"type", "string"}, {"description", "The bash command to execute"}}},
            {"workingDirectory", {{"type", "string"},
                                  {"description", "Optional working directory for the command. "
                                                  "Defaults to the configured base directory."}}},
            {"sandbox", {{"type", "boolean"}, {"default", true},
                         {"description", "Run inside the sandbox (default: true)"}}},
        }},
        {"required", {"command"}},
    };
}

bool RunCommandTool::NeedsApproval(const nlohmann::json& input) const {
    const auto command = GetString(input, "command");
    const bool unsandboxed = !GetBool(input, "sandbox", true) && !options_.disable_sandbox;
    return classifier_->NeedsApproval(command, unsandboxed, options_.require_dangerous_approval);
}

nlohmann::json RunCommandTool::Execute(const nlohmann::json& input) {
    const auto command = GetString(input, "command");
    if (command.empty()) {
        return ErrorResult("command is required", {{"command", command}});
    }

    sandbox::CommandExecutionRequest request;
    request.command = command;
    request.sandbox = !options_.disable_sandbox && GetBool(input, "sandbox", true);
    try {
        request.working_dir = HasString(input, "workingDirectory")
                                  ? boundary_.Resolve(GetString(input, "workingDirectory"))
                                  : boundary_.DefaultDirectory();
    } catch (const security::PathTraversalError& ex) {
        return ErrorResult(ex.what(), {{"command", command}});
    }

    bool timed_out = false;
    bool finished = false;
    std::mutex mutex;
    std::condition_variable cv;
    std::thread watchdog;
    if (options_.timeout.count() > 0) {
        watchdog = std::thread([&, cancel = request.cancel]() mutable {
            std::unique_lock<std::mutex> lock(mutex);
            if (!cv.wait_for(lock, options_.timeout, [&] { return finished; })) {
                timed_out = true;
                cancel.Cancel();
            }
        });
    }

    const auto execution = executor_->Run(request);
    {
        std::lock_guard<std::mutex> lock(mutex);
        finished = true;
    }
    cv.notify_all();
    if (watchdog.joinable()) {
        watchdog.join();
    }

    auto result = sandbox::ToJson(execution);
    result["command"] = command;
    if (timed_out) {
        result["timedOut"] = true;
        result["error"] = "Command timed out after " + std::to_string(options_.timeout.count()) + "ms";
        utils::LogWarn("tool", "runCommand timed out: " + command);
    }
    AttachStream(result, "stdout", output::limits::kCommandStdoutChars, command);
    AttachStream(result, "stderr", output::limits::kCommandStderrChars, command);
    return result;
}

void RunCommandTool::AttachStream(nlohmann::json& result,
                                  const std::string& key,
                                  std::size_t max_chars,
                                  const std::string& command) const {
    if (!result.contains(key) || !result[key].is_string()) {
        return;
    }
    output::TruncateStringOptions truncate;
    truncate.max_chars = max_chars;
    truncate.max_lines = std::numeric_limits<std::size_t>::max();
    truncate.output_dir = options_.output_dir;
    truncate.metadata = {{"tool", Name()}, {"command", command}, {"stream", key}};
    const auto truncation = output::TruncateString(result[key].get<std::string>(), truncate);

    result[key] = truncation.data;
    result[key + "Truncated"] = truncation.truncated;
    if (!truncation.truncated) {
        return;
    }
    if (truncation.saved_path.has_value()) {
        result[key + "SavedPath"] = *truncation.saved_path;
    }
    if (truncation.message.has_value()) {
        result[key + "TruncationMessage"] = *truncation.message;
    }
}

}  // namespace rampart::agent::tools
