#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "agent/tools/search_backend.hpp"
#include "agent/tools/tool.hpp"
#include "security/path_boundary.hpp"

namespace rampart::agent::tools {

struct SearchToolOptions {
    std::optional<std::filesystem::path> output_dir;
    std::size_t max_results = 100;
};

class GrepTool : public Tool {
public:
    GrepTool(security::SecurityBoundary boundary,
             SearchToolOptions options,
             std::shared_ptr<const SearchBackend> backend);

    std::string Name() const override { return "grep"; }
    std::string Description() const override {
        return "Search file contents using regex patterns. Returns matching lines with file paths and "
               "line numbers. Large result sets are automatically truncated.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;

private:
    security::SecurityBoundary boundary_;
    SearchToolOptions options_;
    std::shared_ptr<const SearchBackend> backend_;
};

class GlobFileSearchTool : public Tool {
public:
    GlobFileSearchTool(security::SecurityBoundary boundary,
                       SearchToolOptions options,
                       std::shared_ptr<const SearchBackend> backend);

    std::string Name() const override { return "globFileSearch"; }
    std::string Description() const override {
        return "Find files matching a glob pattern. Returns matching file paths sorted by modification "
               "time (most recent first). Large result sets are automatically truncated.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;

private:
    security::SecurityBoundary boundary_;
    SearchToolOptions options_;
    std::shared_ptr<const SearchBackend> backend_;
};

}  // namespace rampart::agent::tools
