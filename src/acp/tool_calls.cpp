#include "acp/tool_calls.hpp"

#include "acp/protocol.hpp"

namespace piacp::acp {

std::string tool_result_text(const json& result) {
  if (result.is_string()) {
    return result.get<std::string>();
  }
  const json* blocks = &result;
  if (result.is_object() && result.contains("content")) {
    blocks = &result["content"];
    if (blocks->is_string()) {
      return blocks->get<std::string>();
    }
  }
  if (!blocks->is_array()) {
    return "";
  }

  std::string text;
  for (const auto& block : *blocks) {
    if (!block.is_object() || block.value("type", "") != "text") continue;
    auto it = block.find("text");
    if (it == block.end() || !it->is_string()) continue;
    if (!text.empty()) text += "\n";
    text += it->get<std::string>();
  }
  return text;
}

json ToolCallState::make_tool_call(const ToolCallEntry& entry, const json& args) const {
  json update = {{"sessionUpdate", "tool_call"},
                 {"toolCallId", entry.id},
                 {"title", entry.title},
                 {"kind", to_string(entry.kind)},
                 {"status", to_string(entry.status)}};
  if (args.is_object() && !args.empty()) {
    update["rawInput"] = args;
    for (const char* key : {"path", "file_path"}) {
      if (args.contains(key) && args[key].is_string()) {
        update["locations"] = json::array({json{{"path", args[key]}}});
        break;
      }
    }
  }
  return update;
}

ToolCallEntry& ToolCallState::ensure(const ToolCallId& id, const std::string& tool_name, std::vector<json>& out, const json& args) {
  auto it = calls_.find(id);
  if (it != calls_.end()) {
    return it->second;
  }
  ToolCallEntry entry;
  entry.id = id;
  entry.title = tool_name.empty() ? "tool" : tool_name;
  entry.kind = tool_kind_from_name(tool_name);
  entry.status = ToolCallStatus::Pending;
  out.push_back(make_tool_call(entry, args));
  return calls_.emplace(id, std::move(entry)).first->second;
}

std::vector<json> ToolCallState::start(const ToolCallId& id, const std::string& tool_name, const json& args) {
  std::vector<json> out;
  ToolCallEntry entry;
  entry.id = id;
  entry.title = tool_name.empty() ? "tool" : tool_name;
  entry.kind = tool_kind_from_name(tool_name);
  entry.status = ToolCallStatus::InProgress;
  out.push_back(make_tool_call(entry, args));
  calls_[id] = std::move(entry);
  return out;
}

std::vector<json> ToolCallState::progress(const ToolCallId& id, const std::string& tool_name, const json& partial_result) {
  std::vector<json> out;
  auto& entry = ensure(id, tool_name, out, json::object());
  entry.status = ToolCallStatus::InProgress;

  json update = {{"sessionUpdate", "tool_call_update"}, {"toolCallId", id}, {"status", to_string(entry.status)}};
  auto text = tool_result_text(partial_result);
  if (!text.empty()) {
    entry.content = text_tool_content(text);
    update["content"] = entry.content;
  }
  out.push_back(std::move(update));
  return out;
}

std::vector<json> ToolCallState::finish(const ToolCallId& id, const std::string& tool_name, const json& result, bool is_error) {
  std::vector<json> out;
  auto& entry = ensure(id, tool_name, out, json::object());
  entry.status = is_error ? ToolCallStatus::Failed : ToolCallStatus::Completed;
  entry.content = text_tool_content(tool_result_text(result));

  json update = {{"sessionUpdate", "tool_call_update"}, {"toolCallId", id}, {"status", to_string(entry.status)}, {"content", entry.content}};
  if (!result.is_null()) {
    update["rawOutput"] = result;
  }
  out.push_back(std::move(update));
  return out;
}

std::vector<json> ToolCallState::replay_result(const ToolCallId& id, const std::string& tool_name, const json& content, bool is_error) {
  std::vector<json> out;
  auto& entry = ensure(id, tool_name, out, json::object());
  entry.status = is_error ? ToolCallStatus::Failed : ToolCallStatus::Completed;
  entry.content = text_tool_content(tool_result_text(content));

  out.push_back({{"sessionUpdate", "tool_call_update"}, {"toolCallId", id}, {"status", to_string(entry.status)}, {"content", entry.content}});
  return out;
}

const ToolCallEntry* ToolCallState::find(const ToolCallId& id) const {
  auto it = calls_.find(id);
  return it == calls_.end() ? nullptr : &it->second;
}

}  // namespace piacp::acp
