#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace rampart::providers {

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters;
};

enum class Role {
    kSystem,
    kUser,
    kAssistant,
    kTool
};

enum class PartType {
    kText,
    kReasoning,
    kToolCall,
    kToolResult,
    kToolApprovalRequest,
    kToolApprovalResponse
};

const char* ToString(Role role);
const char* ToString(PartType type);
std::optional<Role> ParseRole(const std::string& value);
std::optional<PartType> ParsePartType(const std::string& value);

// Tagged union over the part types; only the fields of `type` are meaningful.
struct ContentPart {
    PartType type = PartType::kText;
    // text, reasoning
    std::string text;
    // tool-call, tool-result, tool-approval-request
    std::string tool_call_id;
    std::string tool_name;
    nlohmann::json input;
    nlohmann::json output;
    // tool-approval-request, tool-approval-response
    std::string approval_id;
    bool approved = false;

    static ContentPart Text(std::string text);
    static ContentPart Reasoning(std::string text);
    static ContentPart ToolCall(std::string id, std::string name, nlohmann::json input);
    static ContentPart ToolResult(std::string id, std::string name, nlohmann::json output);
    static ContentPart ApprovalRequest(std::string approval_id, std::string tool_call_id);
    static ContentPart ApprovalResponse(std::string approval_id, bool approved);
};

bool operator==(const ContentPart& lhs, const ContentPart& rhs);
inline bool operator!=(const ContentPart& lhs, const ContentPart& rhs) { return !(lhs == rhs); }

struct Message {
    Role role = Role::kUser;
    std::vector<ContentPart> content;

    static Message User(std::string text);
    static Message Assistant(std::string text);
};

bool operator==(const Message& lhs, const Message& rhs);
inline bool operator!=(const Message& lhs, const Message& rhs) { return !(lhs == rhs); }

// JSON shape: {"role": "...", "content": [{"type": "tool-call", ...}]}. A
// string content is accepted as a single text part. Unknown roles or part
// types throw std::invalid_argument; missing keys throw nlohmann::json errors.
void to_json(nlohmann::json& j, const ContentPart& part);
void from_json(const nlohmann::json& j, ContentPart& part);
void to_json(nlohmann::json& j, const Message& message);
void from_json(const nlohmann::json& j, Message& message);

struct ToolCallRequest {
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

struct LLMResponse {
    std::string content;
    std::vector<ToolCallRequest> tool_calls;
    std::string finish_reason = "stop";

    bool HasToolCalls() const { return !tool_calls.empty(); }
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(const std::vector<Message>& messages,
                             const std::vector<ToolDefinition>& tools) = 0;
    virtual std::string Name() const = 0;
};

}  // namespace rampart::providers
