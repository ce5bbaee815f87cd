#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "agent/conversation_repair.hpp"
#include "agent/tools/tool_registry.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/command_classifier.hpp"
#include "sandbox/output_channel.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "sandbox/sandbox_policy.hpp"
#include "sandbox/sandbox_wrapper.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

#ifdef RAMPART_WITH_WEB_TOOLS
#include "agent/tools/web.hpp"
#endif

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  rampart tools\n"
              << "  rampart run <tool> '<json input>'\n"
              << "  rampart exec [--no-sandbox] <command...>\n"
              << "  rampart classify <command...>\n"
              << "  rampart repair <history.json>\n"
              << "  rampart policy" << std::endl;
}

std::string JoinArgs(int argc, char** argv, int first) {
    std::vector<std::string> parts;
    for (int i = first; i < argc; ++i) {
        parts.emplace_back(argv[i]);
    }
    return rampart::utils::Join(parts, " ");
}

std::filesystem::path Workspace(const rampart::config::Config& config) {
    if (!config.tools.base_path.empty()) {
        return config.tools.base_path;
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

rampart::sandbox::SandboxPolicy BuildPolicy(const rampart::config::Config& config) {
    return rampart::sandbox::PolicyFromConfig(config.sandbox, rampart::utils::GetHomePath(), Workspace(config));
}

std::unique_ptr<rampart::sandbox::SandboxWrapper> BuildWrapper(const rampart::config::Config& config) {
    if (config.tools.disable_sandbox) {
        return nullptr;
    }
    return rampart::sandbox::CreateSandboxWrapper(BuildPolicy(config));
}

std::unique_ptr<rampart::agent::tools::ToolRegistry> BuildRegistry(const rampart::config::Config& config,
                                                                   rampart::sandbox::SandboxWrapper* wrapper) {
    auto registry = rampart::agent::tools::CreateToolRegistry(config, wrapper);
#ifdef RAMPART_WITH_WEB_TOOLS
    std::optional<std::filesystem::path> output_dir;
    if (!config.tools.output_dir.empty()) {
        output_dir = std::filesystem::path(config.tools.output_dir);
    }
    rampart::agent::tools::RegisterWebTools(*registry, config.web.brave_api_key, output_dir);
#endif
    return registry;
}

int ListTools(const rampart::config::Config& config) {
    auto registry = BuildRegistry(config, nullptr);
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& def : registry->GetDefinitions()) {
        tools.push_back({{"name", def.name}, {"description", def.description}, {"inputSchema", def.parameters}});
    }
    std::cout << tools.dump(2) << std::endl;
    return 0;
}

int RunTool(const rampart::config::Config& config, const std::string& name, const std::string& input_text) {
    const auto input = nlohmann::json::parse(input_text.empty() ? "{}" : input_text, nullptr, false);
    if (input.is_discarded() || !input.is_object()) {
        std::cerr << "Tool input must be a JSON object." << std::endl;
        return 2;
    }
    auto wrapper = BuildWrapper(config);
    auto registry = BuildRegistry(config, wrapper.get());
    if (registry->NeedsApproval(name, input)) {
        std::cerr << "[tool] " << name << " would require approval in an agent session" << std::endl;
    }
    const auto result = registry->Execute(name, input);
    std::cout << result.dump(2) << std::endl;
    return result.value("success", false) ? 0 : 1;
}

int ExecCommand(const rampart::config::Config& config, const std::string& command, bool sandboxed) {
    auto wrapper = BuildWrapper(config);
    rampart::sandbox::ExecutorOptions options;
    options.max_buffer = config.tools.max_buffer;
    options.home_dir = rampart::utils::GetHomePath();
    const rampart::sandbox::SandboxExecutor executor(options, wrapper.get());

    rampart::sandbox::CommandExecutionRequest request;
    request.command = command;
    request.working_dir = Workspace(config);
    request.sandbox = sandboxed;

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    rampart::sandbox::OutputChannel events;
    rampart::sandbox::CommandExecutionResult result;
    std::thread runner([&]() { result = executor.Run(request, &events); });

    bool cancel_sent = false;
    rampart::sandbox::OutputEvent event;
    while (!events.IsClosed() || events.Size() > 0) {
        if (g_signal != 0 && !cancel_sent) {
            rampart::utils::LogInfo("exec", "cancelling");
            request.cancel.Cancel();
            cancel_sent = true;
        }
        if (!events.TryConsume(event, std::chrono::milliseconds(100))) {
            continue;
        }
        auto& out = event.stream == rampart::sandbox::OutputStream::kStdout ? std::cout : std::cerr;
        out << event.chunk << std::flush;
    }
    runner.join();

    nlohmann::json summary = rampart::sandbox::ToJson(result);
    summary.erase("stdout");
    summary.erase("stderr");
    std::cerr << summary.dump() << std::endl;
    // The annotation is appended after streaming, so it has not been shown yet.
    if (const auto pos = result.stderr_text.find("<sandbox_violations>"); pos != std::string::npos) {
        std::cerr << result.stderr_text.substr(pos) << std::endl;
    }
    if (result.exit_code) {
        return *result.exit_code;
    }
    return result.success ? 0 : 1;
}

int ClassifyCommand(const rampart::config::Config& config, const std::string& command) {
    const rampart::sandbox::CommandClassifier classifier(config.tools.dangerous_patterns);
    const auto classification = classifier.Classify(command);
    nlohmann::json output = {
        {"command", command},
        {"dangerous", classification.dangerous},
        {"matched", classification.matched},
        {"needsApproval", classifier.NeedsApproval(command, false, config.tools.require_dangerous_command_approval)},
    };
    std::cout << output.dump(2) << std::endl;
    return 0;
}

int RepairHistory(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        std::cerr << "Cannot open " << path.string() << std::endl;
        return 2;
    }
    try {
        nlohmann::json doc;
        input >> doc;
        const auto history = doc.get<std::vector<rampart::providers::Message>>();
        const auto repaired = rampart::agent::RepairConversation(history);
        std::cout << nlohmann::json(repaired).dump(2) << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Invalid history: " << ex.what() << std::endl;
        return 2;
    }
    return 0;
}

int PrintPolicy(const rampart::config::Config& config) {
    std::cout << BuildPolicy(config).ToJson().dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    const auto config = rampart::config::LoadConfig();

    if (command == "tools") {
        return ListTools(config);
    }
    if (command == "run" && argc >= 3) {
        return RunTool(config, argv[2], argc >= 4 ? argv[3] : "{}");
    }
    if (command == "exec" && argc >= 3) {
        const bool no_sandbox = std::string(argv[2]) == "--no-sandbox";
        const int first = no_sandbox ? 3 : 2;
        if (first >= argc) {
            PrintUsage();
            return 1;
        }
        return ExecCommand(config, JoinArgs(argc, argv, first), !no_sandbox);
    }
    if (command == "classify" && argc >= 3) {
        return ClassifyCommand(config, JoinArgs(argc, argv, 2));
    }
    if (command == "repair" && argc >= 3) {
        return RepairHistory(argv[2]);
    }
    if (command == "policy") {
        return PrintPolicy(config);
    }
    PrintUsage();
    return 1;
}
