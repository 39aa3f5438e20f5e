#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace piacp::acp {

struct ToolCallEntry {
  ToolCallId id;
  std::string title;
  ToolKind kind = ToolKind::Other;
  ToolCallStatus status = ToolCallStatus::Pending;
  json content = json::array();
};

// Reconstructs tool-call lifecycles from pi's flat event/message streams.
// Every method returns the session/update payloads to emit, in order.
// A result for an id never started synthesizes its tool_call first.
class ToolCallState {
 public:
  // tool_execution_start
  std::vector<json> start(const ToolCallId& id, const std::string& tool_name, const json& args);

  // tool_execution_update
  std::vector<json> progress(const ToolCallId& id, const std::string& tool_name, const json& partial_result);

  // tool_execution_end
  std::vector<json> finish(const ToolCallId& id, const std::string& tool_name, const json& result, bool is_error);

  // History replay: a toolResult message is the only record of the call
  std::vector<json> replay_result(const ToolCallId& id, const std::string& tool_name, const json& content, bool is_error);

  const ToolCallEntry* find(const ToolCallId& id) const;

  size_t size() const {
    return calls_.size();
  }

  void clear() {
    calls_.clear();
  }

 private:
  json make_tool_call(const ToolCallEntry& entry, const json& args) const;
  ToolCallEntry& ensure(const ToolCallId& id, const std::string& tool_name, std::vector<json>& out, const json& args);

  std::map<ToolCallId, ToolCallEntry> calls_;
};

// Join the text blocks of a pi result (array of blocks, {content:[...]}, or a string)
std::string tool_result_text(const json& result);

}  // namespace piacp::acp
