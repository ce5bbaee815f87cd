#include "agent/agent_loop.hpp"

#include <utility>

#include "agent/conversation_repair.hpp"
#include "agent/tools/tool.hpp"
#include "utils/logging.hpp"

namespace rampart::agent {

using providers::ContentPart;
using providers::Message;
using providers::Role;

AgentLoop::AgentLoop(providers::LLMProvider& provider,
                     tools::ToolRegistry& tools,
                     config::AgentConfig config,
                     ApprovalHandler approval)
    : provider_(provider)
    , tools_(tools)
    , config_(std::move(config))
    , approval_(std::move(approval)) {}

std::string AgentLoop::ProcessTurn(std::vector<Message>& history, const std::string& user_text) {
    history.push_back(Message::User(user_text));

    std::string final_content;
    try {
        int iteration = 0;
        bool answered = false;
        while (iteration < config_.max_iterations) {
            iteration += 1;
            history = RepairConversation(history);
            auto response = provider_.Chat(history, tools_.GetDefinitions());

            if (!response.HasToolCalls()) {
                final_content = response.content;
                answered = true;
                break;
            }

            Message assistant{Role::kAssistant, {}};
            if (!response.content.empty()) {
                assistant.content.push_back(ContentPart::Text(response.content));
            }
            auto results = RunToolCalls(response.tool_calls, assistant);
            history.push_back(std::move(assistant));
            history.push_back(std::move(results));
        }
        if (!answered) {
            utils::Log(utils::LogLevel::kWarn, "agent", "iteration limit reached",
                       {{"max_iterations", std::to_string(config_.max_iterations)}});
        }
    } catch (const std::exception& ex) {
        utils::LogError("agent", std::string("turn failed: ") + ex.what());
        final_content = std::string("Sorry, I encountered an error: ") + ex.what();
    }

    if (final_content.empty()) {
        final_content = "I've completed processing but have no response to give.";
    }
    history.push_back(Message::Assistant(final_content));
    return final_content;
}

Message AgentLoop::RunToolCalls(const std::vector<providers::ToolCallRequest>& calls, Message& assistant) {
    Message results{Role::kTool, {}};
    for (const auto& call : calls) {
        assistant.content.push_back(ContentPart::ToolCall(call.id, call.name, call.arguments));
        if (!tools_.NeedsApproval(call.name, call.arguments)) {
            results.content.push_back(
                ContentPart::ToolResult(call.id, call.name, tools_.Execute(call.name, call.arguments)));
            continue;
        }

        const auto approval_id = "approval_" + call.id;
        assistant.content.push_back(ContentPart::ApprovalRequest(approval_id, call.id));
        const bool approved = approval_ && approval_(call);
        results.content.push_back(ContentPart::ApprovalResponse(approval_id, approved));
        utils::Log(utils::LogLevel::kInfo, "agent", approved ? "tool call approved" : "tool call denied",
                   {{"name", call.name}, {"id", call.id}});
        if (approved) {
            results.content.push_back(
                ContentPart::ToolResult(call.id, call.name, tools_.Execute(call.name, call.arguments)));
        } else {
            results.content.push_back(
                ContentPart::ToolResult(call.id, call.name, tools::ErrorResult("User denied approval")));
        }
    }
    return results;
}

}  // namespace rampart::agent
