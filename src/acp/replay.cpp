#include "acp/replay.hpp"

#include <spdlog/spdlog.h>

#include "acp/protocol.hpp"

namespace piacp::acp {

namespace {

std::string string_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "";
}

void replay_user(const json& content, std::vector<json>& out) {
  if (content.is_string()) {
    auto text = content.get<std::string>();
    if (!text.empty()) out.push_back(updates::user_message_chunk(text));
    return;
  }
  if (!content.is_array()) return;
  for (const auto& block : content) {
    if (block.is_object() && block.value("type", "") == "text") {
      auto text = string_field(block, "text");
      if (!text.empty()) out.push_back(updates::user_message_chunk(text));
    }
  }
}

void replay_assistant(const json& content, std::vector<json>& out) {
  if (content.is_string()) {
    auto text = content.get<std::string>();
    if (!text.empty()) out.push_back(updates::agent_message_chunk(text));
    return;
  }
  if (!content.is_array()) return;
  for (const auto& block : content) {
    if (!block.is_object()) continue;
    auto type = block.value("type", "");
    if (type == "text") {
      auto text = string_field(block, "text");
      if (!text.empty()) out.push_back(updates::agent_message_chunk(text));
    } else if (type == "thinking") {
      auto text = string_field(block, "thinking");
      if (!text.empty()) out.push_back(updates::agent_thought_chunk(text));
    }
    // toolCall blocks are reconstructed from their toolResult
  }
}

}  // namespace

std::vector<json> replay_messages(const json& messages, ToolCallState& state) {
  std::vector<json> out;
  if (!messages.is_array()) {
    return out;
  }

  for (const auto& message : messages) {
    if (!message.is_object()) continue;
    auto role = message.value("role", "");
    const json content = message.value("content", json(nullptr));

    if (role == "user") {
      replay_user(content, out);
    } else if (role == "assistant") {
      replay_assistant(content, out);
    } else if (role == "toolResult") {
      auto id = string_field(message, "toolCallId");
      if (id.empty()) {
        spdlog::debug("[bridge] toolResult without toolCallId skipped");
        continue;
      }
      auto tool_updates = state.replay_result(id, string_field(message, "toolName"), content, message.value("isError", false));
      out.insert(out.end(), tool_updates.begin(), tool_updates.end());
    }
  }
  return out;
}

std::vector<json> translate_event(const json& event, ToolCallState& state) {
  auto type = event.value("type", "");

  if (type == "message_update") {
    auto it = event.find("assistantMessageEvent");
    if (it == event.end() || !it->is_object()) return {};
    auto delta_type = it->value("type", "");
    auto delta = string_field(*it, "delta");
    if (delta.empty()) return {};
    if (delta_type == "text_delta") return {updates::agent_message_chunk(delta)};
    if (delta_type == "thinking_delta") return {updates::agent_thought_chunk(delta)};
    return {};
  }

  if (type == "tool_execution_start") {
    return state.start(string_field(event, "toolCallId"), string_field(event, "toolName"), event.value("args", json::object()));
  }

  if (type == "tool_execution_update") {
    return state.progress(string_field(event, "toolCallId"), string_field(event, "toolName"), event.value("partialResult", json(nullptr)));
  }

  if (type == "tool_execution_end") {
    return state.finish(string_field(event, "toolCallId"), string_field(event, "toolName"), event.value("result", json(nullptr)),
                        event.value("isError", false));
  }

  return {};
}

}  // namespace piacp::acp
