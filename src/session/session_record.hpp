#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "core/types.hpp"

namespace piacp {

// First line of every session log: {type:"session", id, cwd, timestamp, version}
struct SessionHeader {
  SessionId id;
  std::string cwd;
  std::optional<std::string> timestamp;
  int version = 0;
};

// {type:"message", id, parentId, timestamp, message:{role, content}}
struct MessageRecord {
  std::string id;
  std::optional<std::string> parent_id;
  std::optional<std::string> timestamp;
  std::string role;
  json content;  // string or array of content blocks
};

// {type:"session_info", id, parentId, timestamp, name}; a rename event
struct SessionInfoRecord {
  std::string id;
  std::optional<std::string> parent_id;
  std::optional<std::string> timestamp;
  std::string name;  // trimmed
};

// Any other record kind, or a line that did not parse
struct OtherRecord {
  std::string type;  // empty when the line is not a JSON object
  std::optional<std::string> timestamp;
};

using SessionRecord = std::variant<SessionHeader, MessageRecord, SessionInfoRecord, OtherRecord>;

// Never throws. A header without a string id and cwd is reported as OtherRecord.
SessionRecord parse_session_record(std::string_view line);

std::optional<std::string> record_timestamp(const SessionRecord& record);

// Text of the first text block of a message (or the string content itself)
std::optional<std::string> first_text(const json& content);

}  // namespace piacp
