#include "agent/conversation_repair.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace rampart::agent {
namespace {

using providers::ContentPart;
using providers::Message;
using providers::PartType;
using providers::Role;

std::unordered_set<std::string> AnsweredToolCalls(const std::vector<Message>& messages) {
    std::unordered_set<std::string> answered;
    std::unordered_set<std::string> responded_approvals;
    std::unordered_map<std::string, std::string> approval_to_call;

    for (const auto& message : messages) {
        for (const auto& part : message.content) {
            if (part.type == PartType::kToolResult && !part.tool_call_id.empty()) {
                answered.insert(part.tool_call_id);
            } else if (part.type == PartType::kToolApprovalResponse && !part.approval_id.empty()) {
                responded_approvals.insert(part.approval_id);
            } else if (part.type == PartType::kToolApprovalRequest && !part.approval_id.empty() &&
                       !part.tool_call_id.empty()) {
                approval_to_call[part.approval_id] = part.tool_call_id;
            }
        }
    }
    // Requests count whether answered or still pending.
    for (const auto& [approval_id, call_id] : approval_to_call) {
        answered.insert(call_id);
    }
    return answered;
}

bool HasMeaningfulContent(const std::vector<ContentPart>& parts) {
    return std::any_of(parts.begin(), parts.end(), [](const ContentPart& part) {
        if (part.type == PartType::kText) {
            return !utils::Trim(part.text).empty();
        }
        return part.type == PartType::kToolCall;
    });
}

bool HasToolCalls(const Message& message) {
    return std::any_of(message.content.begin(), message.content.end(),
                       [](const ContentPart& part) { return part.type == PartType::kToolCall; });
}

}  // namespace

std::vector<Message> RepairConversation(const std::vector<Message>& messages) {
    const auto answered = AnsweredToolCalls(messages);
    std::vector<Message> repaired;
    repaired.reserve(messages.size());

    for (std::size_t i = 0; i < messages.size(); ++i) {
        const auto& message = messages[i];
        if (message.role != Role::kAssistant || !HasToolCalls(message)) {
            repaired.push_back(message);
            continue;
        }

        Message filtered{message.role, {}};
        for (const auto& part : message.content) {
            if (part.type == PartType::kToolCall && answered.count(part.tool_call_id) == 0) {
                utils::Log(utils::LogLevel::kWarn, "repair", "removing dangling tool call",
                           {{"id", part.tool_call_id}, {"tool", part.tool_name}});
                continue;
            }
            filtered.content.push_back(part);
        }

        const bool is_last = i + 1 == messages.size();
        if (HasMeaningfulContent(filtered.content) || is_last) {
            repaired.push_back(std::move(filtered));
        } else {
            utils::Log(utils::LogLevel::kWarn, "repair", "dropping assistant message emptied by repair",
                       {{"index", std::to_string(i)}});
        }
    }
    return repaired;
}

}  // namespace rampart::agent
