#include "core/types.hpp"

namespace piacp {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

// Length of the well-formed sequence at pos, 0 when it is not one
size_t utf8_sequence_length(std::string_view s, size_t pos) {
  auto at = [&](size_t k) { return static_cast<unsigned char>(s[pos + k]); };
  unsigned char lead = at(0);
  if (lead < 0x80) return 1;

  size_t len = 0;
  uint32_t cp = 0;
  uint32_t min_cp = 0;
  if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp = lead & 0x1F;
    min_cp = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp = lead & 0x0F;
    min_cp = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp = lead & 0x07;
    min_cp = 0x10000;
  } else {
    return 0;
  }
  if (pos + len > s.size()) return 0;

  for (size_t k = 1; k < len; ++k) {
    if ((at(k) & 0xC0) != 0x80) return 0;
    cp = (cp << 6) | (at(k) & 0x3F);
  }
  // overlong forms, surrogates and anything past U+10FFFF
  if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
  return len;
}

}  // namespace

std::string to_string(StopReason reason) {
  switch (reason) {
    case StopReason::EndTurn:
      return "end_turn";
    case StopReason::Cancelled:
      return "cancelled";
    case StopReason::Refusal:
      return "refusal";
    case StopReason::MaxTokens:
      return "max_tokens";
  }
  return "end_turn";
}

StopReason stop_reason_from_string(const std::string& str) {
  if (str == "cancelled" || str == "aborted") return StopReason::Cancelled;
  if (str == "refusal") return StopReason::Refusal;
  if (str == "max_tokens" || str == "length") return StopReason::MaxTokens;
  return StopReason::EndTurn;
}

std::string to_string(ToolCallStatus status) {
  switch (status) {
    case ToolCallStatus::Pending:
      return "pending";
    case ToolCallStatus::InProgress:
      return "in_progress";
    case ToolCallStatus::Completed:
      return "completed";
    case ToolCallStatus::Failed:
      return "failed";
  }
  return "pending";
}

std::string to_string(ToolKind kind) {
  switch (kind) {
    case ToolKind::Read:
      return "read";
    case ToolKind::Edit:
      return "edit";
    case ToolKind::Delete:
      return "delete";
    case ToolKind::Move:
      return "move";
    case ToolKind::Search:
      return "search";
    case ToolKind::Execute:
      return "execute";
    case ToolKind::Think:
      return "think";
    case ToolKind::Fetch:
      return "fetch";
    case ToolKind::Other:
      return "other";
  }
  return "other";
}

ToolKind tool_kind_from_name(const std::string& tool_name) {
  if (tool_name == "read") return ToolKind::Read;
  if (tool_name == "edit" || tool_name == "write") return ToolKind::Edit;
  if (tool_name == "bash") return ToolKind::Execute;
  if (tool_name == "grep" || tool_name == "find" || tool_name == "ls") return ToolKind::Search;
  return ToolKind::Other;
}

std::string sanitize_utf8(std::string_view input) {
  std::string output;
  output.reserve(input.size());
  size_t i = 0;
  while (i < input.size()) {
    size_t len = utf8_sequence_length(input, i);
    if (len == 0) {
      output.append(kReplacementChar);
      ++i;
      continue;
    }
    output.append(input.substr(i, len));
    i += len;
  }
  return output;
}

std::string truncate_utf8(std::string_view input, size_t max_chars) {
  size_t chars = 0;
  size_t i = 0;
  while (i < input.size() && chars < max_chars) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    size_t len = 1;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
    }
    if (i + len > input.size()) break;
    i += len;
    chars++;
  }
  return std::string(input.substr(0, i));
}

std::string trim(std::string_view input) {
  const char* ws = " \t\r\n\f\v";
  auto begin = input.find_first_not_of(ws);
  if (begin == std::string_view::npos) return "";
  auto end = input.find_last_not_of(ws);
  return std::string(input.substr(begin, end - begin + 1));
}

}  // namespace piacp
