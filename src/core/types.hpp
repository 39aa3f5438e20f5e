#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace piacp {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using ConnectionId = std::string;
using ToolCallId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Why a prompt turn ended (ACP stopReason)
enum class StopReason {
  EndTurn,    // Agent finished the turn
  Cancelled,  // Client sent session/cancel
  Refusal,
  MaxTokens
};

std::string to_string(StopReason reason);

StopReason stop_reason_from_string(const std::string& str);

// Lifecycle of a reconstructed tool call
enum class ToolCallStatus { Pending, InProgress, Completed, Failed };

std::string to_string(ToolCallStatus status);

// ACP tool kinds, used by clients to pick an icon
enum class ToolKind { Read, Edit, Delete, Move, Search, Execute, Think, Fetch, Other };

std::string to_string(ToolKind kind);

ToolKind tool_kind_from_name(const std::string& tool_name);

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(std::string_view input);

// Keep at most max_chars code points; never splits a multi-byte sequence
std::string truncate_utf8(std::string_view input, size_t max_chars);

// Trim ASCII whitespace on both ends
std::string trim(std::string_view input);

}  // namespace piacp
