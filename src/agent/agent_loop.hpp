#pragma once

#include <functional>
#include <string>
#include <vector>

#include "agent/tools/tool_registry.hpp"
#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"

namespace rampart::agent {

// Decides whether a tool call that needs approval may run. Without a handler
// such calls are denied.
using ApprovalHandler = std::function<bool(const providers::ToolCallRequest&)>;

class AgentLoop {
public:
    AgentLoop(providers::LLMProvider& provider,
              tools::ToolRegistry& tools,
              config::AgentConfig config,
              ApprovalHandler approval = {});

    // Appends the user message, then alternates model calls and tool results
    // until the model answers without tool calls or the iteration limit is
    // reached. Returns the final reply, which is also appended to `history`.
    // Provider and registry failures produce an apologetic reply instead of
    // propagating.
    std::string ProcessTurn(std::vector<providers::Message>& history, const std::string& user_text);

private:
    providers::Message RunToolCalls(const std::vector<providers::ToolCallRequest>& calls,
                                    providers::Message& assistant);

    providers::LLMProvider& provider_;
    tools::ToolRegistry& tools_;
    config::AgentConfig config_;
    ApprovalHandler approval_;
};

}  // namespace rampart::agent
