#include "acp/jsonrpc.hpp"

namespace piacp::acp {

JsonRpcMessage JsonRpcMessage::classify(const json& j) {
  JsonRpcMessage msg;

  if (!j.is_object()) {
    msg.invalid_reason = "message must be an object";
    return msg;
  }

  auto version = j.find("jsonrpc");
  if (version == j.end() || !version->is_string() || version->get<std::string>() != "2.0") {
    msg.invalid_reason = "jsonrpc must be \"2.0\"";
    return msg;
  }

  auto id = j.find("id");
  bool has_id = id != j.end();
  if (has_id && !id->is_string() && !id->is_number_integer() && !id->is_null()) {
    msg.invalid_reason = "id must be a string, integer or null";
    return msg;
  }

  auto method = j.find("method");
  if (method == j.end()) {
    if (has_id && (j.contains("result") || j.contains("error"))) {
      msg.kind = MessageKind::Response;
      msg.id = *id;
      return msg;
    }
    msg.invalid_reason = "method is required";
    return msg;
  }
  if (!method->is_string()) {
    msg.invalid_reason = "method must be a string";
    return msg;
  }
  msg.method = method->get<std::string>();

  auto params = j.find("params");
  if (params != j.end() && !params->is_null()) {
    if (!params->is_object() && !params->is_array()) {
      msg.invalid_reason = "params must be an object or array";
      return msg;
    }
    msg.params = *params;
  }

  if (has_id && !id->is_null()) {
    msg.kind = MessageKind::Request;
    msg.id = *id;
  } else {
    msg.kind = MessageKind::Notification;
  }
  return msg;
}

json make_result(const json& id, json result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json make_error(const json& id, const AcpError& error) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", error.to_json()}};
}

json make_notification(const std::string& method, json params) {
  return {{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}};
}

std::string require_string(const json& params, const char* name) {
  if (!params.is_object() || !params.contains(name) || params[name].is_null()) {
    throw errors::missing_param(name);
  }
  const auto& value = params[name];
  if (!value.is_string()) {
    throw errors::param_type(name, "string", value);
  }
  return value.get<std::string>();
}

std::optional<std::string> optional_string(const json& params, const char* name) {
  if (!params.is_object() || !params.contains(name) || params[name].is_null()) {
    return std::nullopt;
  }
  const auto& value = params[name];
  if (!value.is_string()) {
    throw errors::param_type(name, "string", value);
  }
  return value.get<std::string>();
}

}  // namespace piacp::acp
