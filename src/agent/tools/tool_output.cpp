#include "agent/tools/tool_output.hpp"

#include <algorithm>
#include <stdexcept>

#include "output/truncation.hpp"
#include "security/path_boundary.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rampart::agent::tools {

ReadToolOutputTool::ReadToolOutputTool(std::optional<std::filesystem::path> output_dir)
    : output_dir_(std::move(output_dir)) {}

nlohmann::json ReadToolOutputTool::InputSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"path", {{"type", "string"},
                      {"description", "Path to the saved tool output file (from a previous truncated result)"}}},
            {"offset", {{"type", "number"},
                        {"description", "Line number to start reading from (0-indexed, default: 0)"}}},
            {"limit", {{"type", "number"},
                       {"description", "Maximum number of lines to read (default: 500). "
                                       "Use smaller values for exploration."}}},
        }},
        {"required", {"path"}},
    };
}

nlohmann::json ReadToolOutputTool::Execute(const nlohmann::json& input) {
    const auto requested = GetString(input, "path");
    if (requested.empty()) {
        return ErrorResult("path is required", {{"path", requested}});
    }
    if (!output_dir_) {
        return ErrorResult("Tool output directory is not configured", {{"path", requested}});
    }
    // Only files the overflow store wrote are readable here.
    const auto root = security::NormalizeAbsolute(*output_dir_);
    const auto path = security::NormalizeAbsolute(root / requested);
    if (path == root || !security::IsWithin(root, path)) {
        utils::LogWarn("tool", "readToolOutput rejected path outside output dir: " + requested);
        return ErrorResult("Path is outside the tool output directory: " + requested, {{"path", requested}});
    }
    const auto offset = static_cast<std::size_t>(std::max(0LL, GetInteger(input, "offset").value_or(0)));
    auto limit = output::limits::kReadToolOutputLines;
    if (const auto value = GetInteger(input, "limit"); value && *value > 0) {
        limit = static_cast<std::size_t>(*value);
    }

    output::SavedOutputPage page;
    try {
        page = output::ReadSavedToolOutput(path, offset, limit);
    } catch (const std::runtime_error& ex) {
        return ErrorResult(ex.what(), {{"path", requested}});
    }

    nlohmann::json result = {
        {"success", true},
        {"path", path.string()},
        {"content", utils::SanitizeUtf8(page.content)},
        {"totalLines", page.total_lines},
        {"startLine", offset},
        {"linesReturned", utils::SplitLines(page.content).size()},
        {"hasMore", page.has_more},
    };
    if (page.has_more) {
        result["hint"] = "More content available. Use offset=" + std::to_string(offset + limit) +
                         " to continue reading.";
    }
    return result;
}

}  // namespace rampart::agent::tools
