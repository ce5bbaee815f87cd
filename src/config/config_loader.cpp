#include "config/config_loader.hpp"

#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rampart::config {
namespace {

void ReadStringArray(std::vector<std::string>& target, const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ApplyToolsConfig(ToolsConfig& tools, const nlohmann::json& source) {
    if (source.contains("basePath") && source["basePath"].is_string()) {
        tools.base_path = source["basePath"].get<std::string>();
    }
    if (source.contains("outputDir") && source["outputDir"].is_string()) {
        tools.output_dir = source["outputDir"].get<std::string>();
    }
    if (source.contains("maxSearchResults") && source["maxSearchResults"].is_number_integer()) {
        tools.max_search_results = source["maxSearchResults"].get<int>();
    }
    if (source.contains("commandTimeoutMs") && source["commandTimeoutMs"].is_number_integer()) {
        tools.command_timeout_ms = source["commandTimeoutMs"].get<int>();
    }
    if (source.contains("maxBuffer") && source["maxBuffer"].is_number_unsigned()) {
        tools.max_buffer = source["maxBuffer"].get<std::size_t>();
    }
    if (source.contains("requireDangerousCommandApproval") &&
        source["requireDangerousCommandApproval"].is_boolean()) {
        tools.require_dangerous_command_approval = source["requireDangerousCommandApproval"].get<bool>();
    }
    if (source.contains("disableSandbox") && source["disableSandbox"].is_boolean()) {
        tools.disable_sandbox = source["disableSandbox"].get<bool>();
    }
    ReadStringArray(tools.dangerous_patterns, source, "dangerousPatterns");
}

void ApplySandboxConfig(SandboxConfig& sandbox, const nlohmann::json& source) {
    if (source.contains("network") && source["network"].is_object()) {
        const auto& network = source["network"];
        ReadStringArray(sandbox.network.allowed_domains, network, "allowedDomains");
        ReadStringArray(sandbox.network.denied_domains, network, "deniedDomains");
        if (network.contains("allowLocalBinding") && network["allowLocalBinding"].is_boolean()) {
            sandbox.network.allow_local_binding = network["allowLocalBinding"].get<bool>();
        }
    }
    if (source.contains("filesystem") && source["filesystem"].is_object()) {
        const auto& filesystem = source["filesystem"];
        ReadStringArray(sandbox.filesystem.deny_read, filesystem, "denyRead");
        ReadStringArray(sandbox.filesystem.allow_write, filesystem, "allowWrite");
        ReadStringArray(sandbox.filesystem.deny_write, filesystem, "denyWrite");
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto overridden = utils::GetEnv("RAMPART_CONFIG");
    if (!overridden.empty()) {
        return overridden;
    }
    return utils::GetHomePath() / ".rampart" / "config.json";
}

std::string ExpandUserPath(const std::string& value) {
    if (value == "~") {
        return utils::GetHomePath().string();
    }
    if (utils::StartsWith(value, "~/")) {
        return (utils::GetHomePath() / value.substr(2)).string();
    }
    return value;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("tools") && data["tools"].is_object()) {
        ApplyToolsConfig(config.tools, data["tools"]);
    }
    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplySandboxConfig(config.sandbox, data["sandbox"]);
    }
    if (data.contains("web") && data["web"].is_object()) {
        const auto& web = data["web"];
        if (web.contains("braveApiKey") && web["braveApiKey"].is_string()) {
            config.web.brave_api_key = web["braveApiKey"].get<std::string>();
        }
    }
    if (data.contains("agent") && data["agent"].is_object()) {
        const auto& agent = data["agent"];
        if (agent.contains("maxIterations") && agent["maxIterations"].is_number_integer()) {
            config.agent.max_iterations = agent["maxIterations"].get<int>();
        }
    }
}

void ApplyEnvironment(Config& config) {
    const auto workspace = utils::GetEnv("RAMPART_WORKSPACE");
    if (!workspace.empty()) {
        config.tools.base_path = workspace;
    }
    const auto output_dir = utils::GetEnv("RAMPART_OUTPUT_DIR");
    if (!output_dir.empty()) {
        config.tools.output_dir = output_dir;
    }
    const auto sandbox_disabled = utils::GetEnv("RAMPART_SANDBOX_DISABLED");
    if (!sandbox_disabled.empty()) {
        config.tools.disable_sandbox = ParseBool(sandbox_disabled);
    }
    const auto brave_api_key = utils::GetEnv("BRAVE_API_KEY");
    if (!brave_api_key.empty()) {
        config.web.brave_api_key = brave_api_key;
    }
    config.tools.base_path = ExpandUserPath(config.tools.base_path);
    config.tools.output_dir = ExpandUserPath(config.tools.output_dir);
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        try {
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "ignoring malformed " + path.string() + ": " + ex.what());
        }
    }
    ApplyEnvironment(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace rampart::config
