#include "providers/llm_provider.hpp"

#include <stdexcept>

namespace rampart::providers {
namespace {

struct RoleName {
    Role role;
    const char* name;
};

struct PartName {
    PartType type;
    const char* name;
};

constexpr RoleName kRoleNames[] = {
    {Role::kSystem, "system"},
    {Role::kUser, "user"},
    {Role::kAssistant, "assistant"},
    {Role::kTool, "tool"},
};

constexpr PartName kPartNames[] = {
    {PartType::kText, "text"},
    {PartType::kReasoning, "reasoning"},
    {PartType::kToolCall, "tool-call"},
    {PartType::kToolResult, "tool-result"},
    {PartType::kToolApprovalRequest, "tool-approval-request"},
    {PartType::kToolApprovalResponse, "tool-approval-response"},
};

std::string OptionalString(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

}  // namespace

const char* ToString(Role role) {
    for (const auto& entry : kRoleNames) {
        if (entry.role == role) {
            return entry.name;
        }
    }
    return "unknown";
}

const char* ToString(PartType type) {
    for (const auto& entry : kPartNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<Role> ParseRole(const std::string& value) {
    for (const auto& entry : kRoleNames) {
        if (value == entry.name) {
            return entry.role;
        }
    }
    return std::nullopt;
}

std::optional<PartType> ParsePartType(const std::string& value) {
    for (const auto& entry : kPartNames) {
        if (value == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

ContentPart ContentPart::Text(std::string text) {
    ContentPart part;
    part.type = PartType::kText;
    part.text = std::move(text);
    return part;
}

ContentPart ContentPart::Reasoning(std::string text) {
    ContentPart part;
    part.type = PartType::kReasoning;
    part.text = std::move(text);
    return part;
}

ContentPart ContentPart::ToolCall(std::string id, std::string name, nlohmann::json input) {
    ContentPart part;
    part.type = PartType::kToolCall;
    part.tool_call_id = std::move(id);
    part.tool_name = std::move(name);
    part.input = std::move(input);
    return part;
}

ContentPart ContentPart::ToolResult(std::string id, std::string name, nlohmann::json output) {
    ContentPart part;
    part.type = PartType::kToolResult;
    part.tool_call_id = std::move(id);
    part.tool_name = std::move(name);
    part.output = std::move(output);
    return part;
}

ContentPart ContentPart::ApprovalRequest(std::string approval_id, std::string tool_call_id) {
    ContentPart part;
    part.type = PartType::kToolApprovalRequest;
    part.approval_id = std::move(approval_id);
    part.tool_call_id = std::move(tool_call_id);
    return part;
}

ContentPart ContentPart::ApprovalResponse(std::string approval_id, bool approved) {
    ContentPart part;
    part.type = PartType::kToolApprovalResponse;
    part.approval_id = std::move(approval_id);
    part.approved = approved;
    return part;
}

bool operator==(const ContentPart& lhs, const ContentPart& rhs) {
    return lhs.type == rhs.type && lhs.text == rhs.text && lhs.tool_call_id == rhs.tool_call_id &&
           lhs.tool_name == rhs.tool_name && lhs.input == rhs.input && lhs.output == rhs.output &&
           lhs.approval_id == rhs.approval_id && lhs.approved == rhs.approved;
}

Message Message::User(std::string text) {
    return Message{Role::kUser, {ContentPart::Text(std::move(text))}};
}

Message Message::Assistant(std::string text) {
    return Message{Role::kAssistant, {ContentPart::Text(std::move(text))}};
}

bool operator==(const Message& lhs, const Message& rhs) {
    return lhs.role == rhs.role && lhs.content == rhs.content;
}

void to_json(nlohmann::json& j, const ContentPart& part) {
    j = nlohmann::json{{"type", ToString(part.type)}};
    switch (part.type) {
        case PartType::kText:
        case PartType::kReasoning:
            j["text"] = part.text;
            break;
        case PartType::kToolCall:
            j["toolCallId"] = part.tool_call_id;
            j["toolName"] = part.tool_name;
            j["input"] = part.input;
            break;
        case PartType::kToolResult:
            j["toolCallId"] = part.tool_call_id;
            j["toolName"] = part.tool_name;
            j["output"] = part.output;
            break;
        case PartType::kToolApprovalRequest:
            j["approvalId"] = part.approval_id;
            j["toolCallId"] = part.tool_call_id;
            break;
        case PartType::kToolApprovalResponse:
            j["approvalId"] = part.approval_id;
            j["approved"] = part.approved;
            break;
    }
}

void from_json(const nlohmann::json& j, ContentPart& part) {
    const auto type_name = j.at("type").get<std::string>();
    const auto type = ParsePartType(type_name);
    if (!type) {
        throw std::invalid_argument("unknown content part type: " + type_name);
    }
    part = ContentPart{};
    part.type = *type;
    part.text = OptionalString(j, "text");
    part.tool_call_id = OptionalString(j, "toolCallId");
    part.tool_name = OptionalString(j, "toolName");
    part.approval_id = OptionalString(j, "approvalId");
    if (j.contains("input")) {
        part.input = j["input"];
    }
    if (j.contains("output")) {
        part.output = j["output"];
    }
    if (j.contains("approved") && j["approved"].is_boolean()) {
        part.approved = j["approved"].get<bool>();
    }
}

void to_json(nlohmann::json& j, const Message& message) {
    j = nlohmann::json{{"role", ToString(message.role)}, {"content", message.content}};
}

void from_json(const nlohmann::json& j, Message& message) {
    const auto role_name = j.at("role").get<std::string>();
    const auto role = ParseRole(role_name);
    if (!role) {
        throw std::invalid_argument("unknown message role: " + role_name);
    }
    message.role = *role;
    message.content.clear();
    const auto& content = j.at("content");
    if (content.is_string()) {
        message.content.push_back(ContentPart::Text(content.get<std::string>()));
    } else {
        message.content = content.get<std::vector<ContentPart>>();
    }
}

}  // namespace rampart::providers
