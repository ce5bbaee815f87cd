#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "agent/tools/tool.hpp"

namespace rampart::agent::tools {

class ToolRegistry;

class WebSearchTool : public Tool {
public:
    WebSearchTool(std::string api_key, std::optional<std::filesystem::path> output_dir);

    std::string Name() const override { return "webSearch"; }
    std::string Description() const override {
        return "Search the web using the Brave Search API. Returns titles, links and snippets.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;

private:
    std::string api_key_;
    std::optional<std::filesystem::path> output_dir_;
};

class WebFetchTool : public Tool {
public:
    explicit WebFetchTool(std::optional<std::filesystem::path> output_dir);

    std::string Name() const override { return "webFetch"; }
    std::string Description() const override {
        return "Fetch a web page over HTTP(S). With textOnly, HTML markup is stripped. Large pages are "
               "truncated.";
    }
    nlohmann::json InputSchema() const override;
    nlohmann::json Execute(const nlohmann::json& input) override;

private:
    std::optional<std::filesystem::path> output_dir_;
};

// Reduces an HTML document to whitespace-collapsed text; script and style
// bodies are dropped.
std::string StripHtml(const std::string& input);

void RegisterWebTools(ToolRegistry& registry,
                      const std::string& brave_api_key,
                      const std::optional<std::filesystem::path>& output_dir);

}  // namespace rampart::agent::tools
