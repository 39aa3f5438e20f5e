#pragma once

#include <vector>

#include "acp/tool_calls.hpp"
#include "core/types.hpp"

namespace piacp::acp {

// Turn pi's message history into session/update payloads, in record order.
//
//   user        user_message_chunk per text
//   assistant   agent_message_chunk per text block, agent_thought_chunk per thinking block
//   toolResult  tool_call (title = tool name) then tool_call_update completed|failed
std::vector<json> replay_messages(const json& messages, ToolCallState& state);

// Map one live pi event to session/update payloads (may be empty)
std::vector<json> translate_event(const json& event, ToolCallState& state);

}  // namespace piacp::acp
