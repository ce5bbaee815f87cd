#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "agent/tools/tool.hpp"
#include "sandbox/command_classifier.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "security/path_boundary.hpp"

namespace rampart::agent::tools {

struct RunCommandOptions {
    // Zero disables the deadline.
    std::chrono::milliseconds timeout{30000};
    std::optional<std::filesystem::path> output_dir;
    bool require_dangerous_approval = true;
    bool disable_sandbox = false;
};

class RunCommandTool : public Tool {
public:
    RunCommandTool(security::SecurityBoundary boundary,
                   std::shared_ptr<const sandbox::SandboxExecutor> executor,
                   std::shared_ptr<const sandbox::CommandClassifier> classifier,
                   RunCommandOptions options);

    std::string Name() const override { return "runCommand"; }
    std::string Description() const override;
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;
    bool NeedsApproval(const nlohmann::json& input) const override;

private:
    void AttachStream(nlohmann::json& result,
                      const std::string& key,
                      std::size_t max_chars,
                      const std::string& command) const;

    security::SecurityBoundary boundary_;
    std::shared_ptr<const sandbox::SandboxExecutor> executor_;
    std::shared_ptr<const sandbox::CommandClassifier> classifier_;
    RunCommandOptions options_;
};

}  // namespace rampart::agent::tools
