#pragma once

#include <string>

#include "core/types.hpp"

namespace piacp::acp {

// ACP method names
namespace methods {
constexpr const char* kInitialize = "initialize";
constexpr const char* kInitialized = "initialized";

constexpr const char* kSessionNew = "session/new";
constexpr const char* kSessionLoad = "session/load";
constexpr const char* kSessionResume = "session/resume";
constexpr const char* kSessionList = "session/list";
constexpr const char* kSessionCancel = "session/cancel";
constexpr const char* kSessionPrompt = "session/prompt";
constexpr const char* kSessionUpdate = "session/update";

constexpr const char* kToolApproval = "item/tool/requestApproval";
constexpr const char* kToolUserInput = "item/tool/requestUserInput";

constexpr const char* kGenUIAction = "genui/action";
}  // namespace methods

// session/update payload builders. Each returns the `update` object.
namespace updates {

json user_message_chunk(const std::string& text);

json agent_message_chunk(const std::string& text);

json agent_thought_chunk(const std::string& text);

json session_info_update(const std::string& title);

json available_commands_update(const json& commands);

json tool_approval_request(const std::string& request_id, const std::string& title, const std::string& message);

json user_input_request(const std::string& request_id, const std::string& method, const std::string& title, const json& extra);

}  // namespace updates

// {jsonrpc:"2.0", method:"session/update", params:{sessionId, update}}
json session_update(const SessionId& session_id, const json& update);

// [{type:"content", content:{type:"text", text}}]
json text_tool_content(const std::string& text);

}  // namespace piacp::acp
