#include "core/error.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <typeinfo>

namespace piacp {

namespace {

std::string demangle(const char* name) {
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled) {
    return demangled.get();
  }
  return name;
}

}  // namespace

int error_code(ErrorKind kind) {
  using namespace error_codes;
  switch (kind) {
    case ErrorKind::ParseError:
      return kParseError;
    case ErrorKind::InvalidRequest:
      return kInvalidRequest;
    case ErrorKind::MethodNotFound:
      return kMethodNotFound;
    case ErrorKind::InvalidParams:
      return kInvalidParams;
    case ErrorKind::InternalError:
      return kInternalError;
    case ErrorKind::ServerError:
      return kServerError;
    case ErrorKind::AuthRequired:
      return kAuthRequired;
    case ErrorKind::SessionNotFound:
      return kSessionNotFound;
    case ErrorKind::SessionAlreadyExists:
      return kSessionAlreadyExists;
    case ErrorKind::SessionExpired:
      return kSessionExpired;
    case ErrorKind::NotInitialized:
      return kNotInitialized;
    case ErrorKind::AlreadyInitialized:
      return kAlreadyInitialized;
    case ErrorKind::Unauthorized:
      return kUnauthorized;
    case ErrorKind::ToolNotFound:
      return kToolNotFound;
    case ErrorKind::ApprovalDenied:
      return kApprovalDenied;
    case ErrorKind::UserInputTimeout:
      return kUserInputTimeout;
    case ErrorKind::GenUIActionFailed:
      return kGenUIActionFailed;
  }
  return kInternalError;
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ParseError:
      return "ParseError";
    case ErrorKind::InvalidRequest:
      return "InvalidRequest";
    case ErrorKind::MethodNotFound:
      return "MethodNotFound";
    case ErrorKind::InvalidParams:
      return "InvalidParams";
    case ErrorKind::InternalError:
      return "InternalError";
    case ErrorKind::ServerError:
      return "ServerError";
    case ErrorKind::AuthRequired:
      return "AuthRequired";
    case ErrorKind::SessionNotFound:
      return "SessionNotFound";
    case ErrorKind::SessionAlreadyExists:
      return "SessionAlreadyExists";
    case ErrorKind::SessionExpired:
      return "SessionExpired";
    case ErrorKind::NotInitialized:
      return "NotInitialized";
    case ErrorKind::AlreadyInitialized:
      return "AlreadyInitialized";
    case ErrorKind::Unauthorized:
      return "Unauthorized";
    case ErrorKind::ToolNotFound:
      return "ToolNotFound";
    case ErrorKind::ApprovalDenied:
      return "ApprovalDenied";
    case ErrorKind::UserInputTimeout:
      return "UserInputTimeout";
    case ErrorKind::GenUIActionFailed:
      return "GenUIActionFailed";
  }
  return "InternalError";
}

AcpError::AcpError(ErrorKind kind, const std::string& message, json data) : std::runtime_error(message), kind_(kind), data_(std::move(data)) {}

json AcpError::to_json() const {
  json j = {{"code", code()}, {"message", what()}};
  if (has_data()) {
    j["data"] = data_;
  }
  return j;
}

namespace errors {

AcpError parse_error(const std::string& detail) {
  if (detail.empty()) return AcpError(ErrorKind::ParseError, "Parse error");
  return AcpError(ErrorKind::ParseError, "Parse error: " + detail, {{"detail", detail}});
}

AcpError invalid_request(const std::string& detail) {
  if (detail.empty()) return AcpError(ErrorKind::InvalidRequest, "Invalid request");
  return AcpError(ErrorKind::InvalidRequest, "Invalid request: " + detail, {{"detail", detail}});
}

AcpError method_not_found(const std::string& method) {
  return AcpError(ErrorKind::MethodNotFound, "Method not found: " + method, {{"method", method}});
}

AcpError invalid_params(const std::string& message, json data) {
  return AcpError(ErrorKind::InvalidParams, message, std::move(data));
}

AcpError missing_param(const std::string& name) {
  return AcpError(ErrorKind::InvalidParams, "Missing required parameter: " + name, {{"param", name}, {"reason", "missing"}});
}

AcpError param_type(const std::string& name, const std::string& expected, const json& received) {
  return AcpError(ErrorKind::InvalidParams, "Parameter '" + name + "' must be of type " + expected,
                  {{"param", name}, {"expected", expected}, {"received", received.type_name()}, {"reason", "type_mismatch"}});
}

AcpError internal(const std::string& message, json data) {
  return AcpError(ErrorKind::InternalError, message, std::move(data));
}

AcpError internal_from(const std::exception& cause) {
  if (auto acp = dynamic_cast<const AcpError*>(&cause)) {
    return *acp;
  }
  return AcpError(ErrorKind::InternalError, cause.what(), {{"cause", cause.what()}, {"exception", demangle(typeid(cause).name())}});
}

AcpError server_error(const std::string& message) {
  return AcpError(ErrorKind::ServerError, message);
}

AcpError auth_required(const std::vector<std::string>& auth_methods) {
  std::string message = "Authentication required";
  if (!auth_methods.empty()) {
    message += ". Available methods: ";
    for (size_t i = 0; i < auth_methods.size(); ++i) {
      if (i > 0) message += ", ";
      message += auth_methods[i];
    }
  }
  return AcpError(ErrorKind::AuthRequired, message, {{"authMethods", auth_methods}});
}

AcpError session_not_found(const SessionId& session_id) {
  return AcpError(ErrorKind::SessionNotFound, "Session not found: " + session_id, {{"sessionId", session_id}});
}

AcpError session_already_exists(const SessionId& session_id) {
  return AcpError(ErrorKind::SessionAlreadyExists, "Session already exists: " + session_id, {{"sessionId", session_id}});
}

AcpError session_expired(const SessionId& session_id) {
  return AcpError(ErrorKind::SessionExpired, "Session expired: " + session_id, {{"sessionId", session_id}});
}

AcpError not_initialized(const std::string& method) {
  return AcpError(ErrorKind::NotInitialized, "Connection not initialized; call initialize before " + method, {{"method", method}});
}

AcpError already_initialized() {
  return AcpError(ErrorKind::AlreadyInitialized, "Connection already initialized");
}

AcpError unauthorized(const std::string& operation) {
  return AcpError(ErrorKind::Unauthorized, "Operation not allowed: " + operation, {{"operation", operation}});
}

AcpError tool_not_found(const std::string& request_id) {
  return AcpError(ErrorKind::ToolNotFound, "No pending tool request: " + request_id, {{"requestId", request_id}});
}

AcpError approval_denied(const std::string& request_id) {
  return AcpError(ErrorKind::ApprovalDenied, "Tool approval denied", {{"requestId", request_id}});
}

AcpError user_input_timeout(const std::string& request_id) {
  return AcpError(ErrorKind::UserInputTimeout, "User input request timed out", {{"requestId", request_id}});
}

AcpError genui_action_failed(const std::string& action, const std::string& cause) {
  return AcpError(ErrorKind::GenUIActionFailed, "GenUI action failed: " + action, {{"action", action}, {"cause", cause}});
}

}  // namespace errors

}  // namespace piacp
