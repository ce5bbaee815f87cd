#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "agent/tools/tool.hpp"

namespace rampart::agent::tools {

// Pages through overflow files written when another tool's result was cut.
class ReadToolOutputTool : public Tool {
public:
    explicit ReadToolOutputTool(std::optional<std::filesystem::path> output_dir);

    std::string Name() const override { return "readToolOutput"; }
    std::string Description() const override {
        return "Read a previously saved tool output file that was truncated. Use this to explore large "
               "results from grep, readFile, or other tools that were too big to return directly. "
               "Supports pagination with offset/limit.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;

private:
    std::optional<std::filesystem::path> output_dir_;
};

}  // namespace rampart::agent::tools
