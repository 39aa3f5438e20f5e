#pragma once

#include <string>

#include "core/error.hpp"
#include "core/types.hpp"

namespace piacp::acp {

enum class MessageKind { Request, Notification, Response, Invalid };

// One inbound JSON-RPC 2.0 envelope
struct JsonRpcMessage {
  MessageKind kind = MessageKind::Invalid;
  json id;  // string or number for requests/responses, null otherwise
  std::string method;
  json params = json::object();
  std::string invalid_reason;

  bool is_request() const {
    return kind == MessageKind::Request;
  }

  bool is_notification() const {
    return kind == MessageKind::Notification;
  }

  static JsonRpcMessage classify(const json& j);
};

json make_result(const json& id, json result);

json make_error(const json& id, const AcpError& error);

json make_notification(const std::string& method, json params);

// Typed parameter access that raises InvalidParams
std::string require_string(const json& params, const char* name);

std::optional<std::string> optional_string(const json& params, const char* name);

}  // namespace piacp::acp
