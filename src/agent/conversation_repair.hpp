#pragma once

#include <vector>

#include "providers/llm_provider.hpp"

namespace rampart::agent {

// Removes tool calls that nothing answers before a history is sent to a model.
// A call is answered by a tool-result with its id, by an approval request whose
// approval id has a response, or by a still-pending approval request. An
// assistant message left without text or tool calls is dropped, except the
// last message of the history, which is kept even when empty. Messages without
// tool calls pass through untouched, so a consistent history is returned as is.
std::vector<providers::Message> RepairConversation(const std::vector<providers::Message>& messages);

}  // namespace rampart::agent
