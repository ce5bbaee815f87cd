#include "agent/tools/tool_registry.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "agent/tools/filesystem.hpp"
#include "agent/tools/search.hpp"
#include "agent/tools/shell.hpp"
#include "agent/tools/tool_output.hpp"
#include "sandbox/command_classifier.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "security/path_boundary.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rampart::agent::tools {
namespace {

struct ToolKindName {
    ToolKind kind;
    const char* name;
};

constexpr ToolKindName kToolNames[] = {
    {ToolKind::kReadFile, "readFile"},
    {ToolKind::kWriteFile, "writeFile"},
    {ToolKind::kEditFile, "editFile"},
    {ToolKind::kDeleteFile, "deleteFile"},
    {ToolKind::kListDirectory, "listDirectory"},
    {ToolKind::kFileExists, "fileExists"},
    {ToolKind::kGrep, "grep"},
    {ToolKind::kGlobFileSearch, "globFileSearch"},
    {ToolKind::kRunCommand, "runCommand"},
    {ToolKind::kReadToolOutput, "readToolOutput"},
    {ToolKind::kWebSearch, "webSearch"},
    {ToolKind::kWebFetch, "webFetch"},
};

}  // namespace

const char* ToString(ToolKind kind) {
    for (const auto& entry : kToolNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<ToolKind> ParseToolKind(const std::string& name) {
    for (const auto& entry : kToolNames) {
        if (name == entry.name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

void ToolRegistry::Register(ToolKind kind, std::shared_ptr<Tool> tool) {
    if (!tool || tool->Name() != ToString(kind)) {
        throw std::invalid_argument(std::string("tool does not implement ") + ToString(kind));
    }
    tools_[kind] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) const {
    const auto kind = ParseToolKind(name);
    if (!kind) {
        return nullptr;
    }
    auto it = tools_.find(*kind);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return Get(name) != nullptr;
}

std::vector<providers::ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<providers::ToolDefinition> defs;
    for (const auto& [kind, tool] : tools_) {
        providers::ToolDefinition def{};
        def.name = ToString(kind);
        def.description = tool->Description();
        def.parameters = tool->InputSchema();
        defs.push_back(std::move(def));
    }
    return defs;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [kind, _] : tools_) {
        names.push_back(ToString(kind));
    }
    return names;
}

nlohmann::json ToolRegistry::Execute(const std::string& name, const nlohmann::json& input) const {
    auto* tool = Get(name);
    if (!tool) {
        utils::LogWarn("tool", "unknown tool requested: " + name);
        return ErrorResult("Unknown tool: " + name);
    }
    utils::Log(utils::LogLevel::kInfo, "tool", "start", {
        {"name", name},
        {"input", input.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)},
    });
    const auto started = std::chrono::steady_clock::now();
    nlohmann::json result;
    try {
        result = tool->Execute(input);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "tool", "failed", {{"name", name}, {"error", ex.what()}});
        result = ErrorResult(ex.what());
    }
    std::string serialized;
    try {
        serialized = result.dump();
    } catch (const nlohmann::json::type_error& ex) {
        // Invalid UTF-8 slipped into a string; re-encode it with U+FFFD.
        utils::Log(utils::LogLevel::kWarn, "tool", "invalid UTF-8 in result", {{"name", name}, {"error", ex.what()}});
        serialized = result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        result = nlohmann::json::parse(serialized);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    utils::Log(utils::LogLevel::kInfo, "tool", "end", {
        {"name", name},
        {"size", std::to_string(serialized.size())},
        {"ms", std::to_string(elapsed.count())},
    });
    return result;
}

bool ToolRegistry::NeedsApproval(const std::string& name, const nlohmann::json& input) const {
    const auto* tool = Get(name);
    return tool != nullptr && tool->NeedsApproval(input);
}

std::unique_ptr<ToolRegistry> CreateToolRegistry(const config::Config& config,
                                                 sandbox::SandboxWrapper* wrapper,
                                                 std::shared_ptr<const SearchBackend> search_backend) {
    const auto& tools = config.tools;
    const auto home = utils::GetHomePath();

    security::BoundaryOptions boundary_options;
    if (!tools.base_path.empty()) {
        boundary_options.base_path = std::filesystem::path(tools.base_path);
    }
    boundary_options.home_dir = home;
    const security::SecurityBoundary boundary(boundary_options);

    std::optional<std::filesystem::path> output_dir;
    if (!tools.output_dir.empty()) {
        output_dir = std::filesystem::path(tools.output_dir);
    }

    sandbox::ExecutorOptions executor_options;
    executor_options.max_buffer = tools.max_buffer;
    executor_options.home_dir = home;
    auto executor = std::make_shared<const sandbox::SandboxExecutor>(
        executor_options, tools.disable_sandbox ? nullptr : wrapper);
    auto classifier = std::make_shared<const sandbox::CommandClassifier>(tools.dangerous_patterns);

    if (!search_backend) {
        search_backend = SearchBackend::Detect();
    }
    SearchToolOptions search_options;
    search_options.output_dir = output_dir;
    search_options.max_results = static_cast<std::size_t>(std::max(1, tools.max_search_results));

    RunCommandOptions command_options;
    command_options.timeout = std::chrono::milliseconds(std::max(0, tools.command_timeout_ms));
    command_options.output_dir = output_dir;
    command_options.require_dangerous_approval = tools.require_dangerous_command_approval;
    command_options.disable_sandbox = tools.disable_sandbox;

    auto registry = std::make_unique<ToolRegistry>();
    registry->Register(ToolKind::kReadFile, std::make_shared<ReadFileTool>(boundary, output_dir));
    registry->Register(ToolKind::kWriteFile, std::make_shared<WriteFileTool>(boundary, output_dir));
    registry->Register(ToolKind::kEditFile, std::make_shared<EditFileTool>(boundary, output_dir));
    registry->Register(ToolKind::kDeleteFile, std::make_shared<DeleteFileTool>(boundary, output_dir));
    registry->Register(ToolKind::kListDirectory, std::make_shared<ListDirectoryTool>(boundary, output_dir));
    registry->Register(ToolKind::kFileExists, std::make_shared<FileExistsTool>(boundary, output_dir));
    registry->Register(ToolKind::kGrep,
                       std::make_shared<GrepTool>(boundary, search_options, search_backend));
    registry->Register(ToolKind::kGlobFileSearch,
                       std::make_shared<GlobFileSearchTool>(boundary, search_options, search_backend));
    registry->Register(ToolKind::kRunCommand,
                       std::make_shared<RunCommandTool>(boundary, executor, classifier, command_options));
    registry->Register(ToolKind::kReadToolOutput, std::make_shared<ReadToolOutputTool>(output_dir));

    utils::Log(utils::LogLevel::kInfo, "tool", "registry ready", {
        {"tools", utils::Join(registry->List(), ",")},
        {"sandbox", executor->HasSandbox() ? "enabled" : "disabled"},
        {"search", search_backend->Name()},
    });
    return registry;
}

}  // namespace rampart::agent::tools
