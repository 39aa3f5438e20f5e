#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace piacp {

// JSON-RPC 2.0 and ACP error kinds.
//
// The standard JSON-RPC range (-32700 .. -32600) is followed by the ACP
// server range (-32000 .. -32099). AuthRequired lives at -32011 so that it
// does not collide with SessionNotFound (-32001).
enum class ErrorKind {
  ParseError,
  InvalidRequest,
  MethodNotFound,
  InvalidParams,
  InternalError,
  ServerError,
  AuthRequired,
  SessionNotFound,
  SessionAlreadyExists,
  SessionExpired,
  NotInitialized,
  AlreadyInitialized,
  Unauthorized,
  ToolNotFound,
  ApprovalDenied,
  UserInputTimeout,
  GenUIActionFailed
};

namespace error_codes {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kServerError = -32000;
constexpr int kSessionNotFound = -32001;
constexpr int kSessionAlreadyExists = -32002;
constexpr int kSessionExpired = -32003;
constexpr int kNotInitialized = -32004;
constexpr int kAlreadyInitialized = -32005;
constexpr int kUnauthorized = -32006;
constexpr int kToolNotFound = -32007;
constexpr int kApprovalDenied = -32008;
constexpr int kUserInputTimeout = -32009;
constexpr int kGenUIActionFailed = -32010;
constexpr int kAuthRequired = -32011;

constexpr int kServerErrorMin = -32099;
constexpr int kServerErrorMax = -32000;
}  // namespace error_codes

int error_code(ErrorKind kind);

std::string to_string(ErrorKind kind);

// Error object carried back to the client as the JSON-RPC `error` member
class AcpError : public std::runtime_error {
 public:
  AcpError(ErrorKind kind, const std::string& message, json data = nullptr);

  ErrorKind kind() const {
    return kind_;
  }

  int code() const {
    return error_code(kind_);
  }

  const json& data() const {
    return data_;
  }

  bool has_data() const {
    return !data_.is_null();
  }

  bool is(ErrorKind kind) const {
    return kind_ == kind;
  }

  // {code, message, data?}
  json to_json() const;

 private:
  ErrorKind kind_;
  json data_;
};

// One constructor per error kind
namespace errors {

AcpError parse_error(const std::string& detail = "");

AcpError invalid_request(const std::string& detail = "");

AcpError method_not_found(const std::string& method);

AcpError invalid_params(const std::string& message = "Invalid params", json data = nullptr);

AcpError missing_param(const std::string& name);

AcpError param_type(const std::string& name, const std::string& expected, const json& received);

AcpError internal(const std::string& message = "Internal error", json data = nullptr);

// Wraps an unexpected exception, keeping its message and type for diagnostics
AcpError internal_from(const std::exception& cause);

AcpError server_error(const std::string& message);

AcpError auth_required(const std::vector<std::string>& auth_methods = {});

AcpError session_not_found(const SessionId& session_id);

AcpError session_already_exists(const SessionId& session_id);

AcpError session_expired(const SessionId& session_id);

AcpError not_initialized(const std::string& method);

AcpError already_initialized();

AcpError unauthorized(const std::string& operation);

AcpError tool_not_found(const std::string& request_id);

AcpError approval_denied(const std::string& request_id);

AcpError user_input_timeout(const std::string& request_id);

AcpError genui_action_failed(const std::string& action, const std::string& cause);

}  // namespace errors

}  // namespace piacp
