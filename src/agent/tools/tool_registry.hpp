#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agent/tools/search_backend.hpp"
#include "agent/tools/tool.hpp"
#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"
#include "sandbox/sandbox_wrapper.hpp"

namespace rampart::agent::tools {

// Closed set of tools a model may call.
enum class ToolKind {
    kReadFile,
    kWriteFile,
    kEditFile,
    kDeleteFile,
    kListDirectory,
    kFileExists,
    kGrep,
    kGlobFileSearch,
    kRunCommand,
    kReadToolOutput,
    kWebSearch,
    kWebFetch
};

const char* ToString(ToolKind kind);
std::optional<ToolKind> ParseToolKind(const std::string& name);

class ToolRegistry {
public:
    // Throws std::invalid_argument when the tool's name does not match `kind`.
    void Register(ToolKind kind, std::shared_ptr<Tool> tool);
    Tool* Get(const std::string& name) const;
    bool Has(const std::string& name) const;
    std::vector<providers::ToolDefinition> GetDefinitions() const;
    std::vector<std::string> List() const;

    // Never throws: unknown names and escaped exceptions become
    // {"success": false, "error": ...}.
    nlohmann::json Execute(const std::string& name, const nlohmann::json& input) const;

    // False for unknown tools.
    bool NeedsApproval(const std::string& name, const nlohmann::json& input) const;

private:
    std::map<ToolKind, std::shared_ptr<Tool>> tools_;
};

// Builds the core tools (file, search, command, pagination) from one
// configuration. `wrapper` may be null and must outlive the registry.
std::unique_ptr<ToolRegistry> CreateToolRegistry(const config::Config& config,
                                                 sandbox::SandboxWrapper* wrapper,
                                                 std::shared_ptr<const SearchBackend> search_backend = nullptr);

}  // namespace rampart::agent::tools
