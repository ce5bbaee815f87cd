#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rampart::config {

struct ToolsConfig {
    // Boundary base; empty disables path sandboxing.
    std::string base_path;
    // Overflow directory; empty means truncated output is not persisted.
    std::string output_dir;
    int max_search_results = 100;
    int command_timeout_ms = 30000;
    std::size_t max_buffer = 1024 * 1024;
    bool require_dangerous_command_approval = true;
    std::vector<std::string> dangerous_patterns;
    bool disable_sandbox = false;
};

struct NetworkConfig {
    std::vector<std::string> allowed_domains;
    std::vector<std::string> denied_domains;
    bool allow_local_binding = false;
};

struct FilesystemConfig {
    std::vector<std::string> deny_read;
    std::vector<std::string> allow_write;
    std::vector<std::string> deny_write;
};

struct SandboxConfig {
    NetworkConfig network;
    FilesystemConfig filesystem;
};

struct WebConfig {
    std::string brave_api_key;
};

struct AgentConfig {
    int max_iterations = 20;
};

struct Config {
    ToolsConfig tools;
    SandboxConfig sandbox;
    WebConfig web;
    AgentConfig agent;
};

}  // namespace rampart::config
