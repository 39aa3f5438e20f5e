#include "acp/protocol.hpp"

namespace piacp::acp {

namespace {

json text_chunk(const char* kind, const std::string& text) {
  return {{"sessionUpdate", kind}, {"content", {{"type", "text"}, {"text", text}}}};
}

}  // namespace

namespace updates {

json user_message_chunk(const std::string& text) {
  return text_chunk("user_message_chunk", text);
}

json agent_message_chunk(const std::string& text) {
  return text_chunk("agent_message_chunk", text);
}

json agent_thought_chunk(const std::string& text) {
  return text_chunk("agent_thought_chunk", text);
}

json session_info_update(const std::string& title) {
  return {{"sessionUpdate", "session_info_update"}, {"title", title}};
}

json available_commands_update(const json& commands) {
  return {{"sessionUpdate", "available_commands_update"}, {"availableCommands", commands}};
}

json tool_approval_request(const std::string& request_id, const std::string& title, const std::string& message) {
  return {{"sessionUpdate", "tool_approval_request"}, {"requestId", request_id}, {"title", title}, {"message", message}};
}

json user_input_request(const std::string& request_id, const std::string& method, const std::string& title, const json& extra) {
  json update = {{"sessionUpdate", "user_input_request"}, {"requestId", request_id}, {"method", method}, {"title", title}};
  if (extra.is_object()) {
    for (auto it = extra.begin(); it != extra.end(); ++it) {
      update[it.key()] = it.value();
    }
  }
  return update;
}

}  // namespace updates

json session_update(const SessionId& session_id, const json& update) {
  return {{"jsonrpc", "2.0"}, {"method", methods::kSessionUpdate}, {"params", {{"sessionId", session_id}, {"update", update}}}};
}

json text_tool_content(const std::string& text) {
  json block = {{"type", "content"}, {"content", {{"type", "text"}, {"text", text}}}};
  return json::array({block});
}

}  // namespace piacp::acp
