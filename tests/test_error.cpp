#include <gtest/gtest.h>

#include <set>

#include "core/error.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

using namespace piacp;

// ============================================================
// Error codes
// ============================================================

TEST(ErrorCodeTest, StandardJsonRpcCodes) {
  EXPECT_EQ(error_code(ErrorKind::ParseError), -32700);
  EXPECT_EQ(error_code(ErrorKind::InvalidRequest), -32600);
  EXPECT_EQ(error_code(ErrorKind::MethodNotFound), -32601);
  EXPECT_EQ(error_code(ErrorKind::InvalidParams), -32602);
  EXPECT_EQ(error_code(ErrorKind::InternalError), -32603);
}

TEST(ErrorCodeTest, AuthRequiredDoesNotCollideWithSessionNotFound) {
  EXPECT_EQ(error_code(ErrorKind::SessionNotFound), -32001);
  EXPECT_EQ(error_code(ErrorKind::AuthRequired), -32011);
  EXPECT_NE(error_code(ErrorKind::AuthRequired), error_code(ErrorKind::SessionNotFound));
}

TEST(ErrorCodeTest, EveryKindHasAUniqueCode) {
  const ErrorKind kinds[] = {
      ErrorKind::ParseError,      ErrorKind::InvalidRequest,     ErrorKind::MethodNotFound,  ErrorKind::InvalidParams,
      ErrorKind::InternalError,   ErrorKind::ServerError,        ErrorKind::AuthRequired,    ErrorKind::SessionNotFound,
      ErrorKind::SessionAlreadyExists, ErrorKind::SessionExpired, ErrorKind::NotInitialized, ErrorKind::AlreadyInitialized,
      ErrorKind::Unauthorized,    ErrorKind::ToolNotFound,       ErrorKind::ApprovalDenied,  ErrorKind::UserInputTimeout,
      ErrorKind::GenUIActionFailed,
  };
  std::set<int> codes;
  for (auto kind : kinds) {
    int code = error_code(kind);
    EXPECT_TRUE(codes.insert(code).second) << to_string(kind);
    EXPECT_GE(code, -32700);
    EXPECT_LE(code, -32000);
  }
  EXPECT_EQ(codes.size(), 17u);
}

TEST(ErrorCodeTest, KindNames) {
  EXPECT_EQ(to_string(ErrorKind::SessionNotFound), "SessionNotFound");
  EXPECT_EQ(to_string(ErrorKind::GenUIActionFailed), "GenUIActionFailed");
}

// ============================================================
// AcpError
// ============================================================

TEST(AcpErrorTest, ToJsonOmitsNullData) {
  auto err = errors::server_error("boom");
  auto j = err.to_json();
  EXPECT_EQ(j["code"], -32000);
  EXPECT_EQ(j["message"], "boom");
  EXPECT_FALSE(j.contains("data"));
}

TEST(AcpErrorTest, SessionNotFoundCarriesId) {
  auto err = errors::session_not_found("abc");
  EXPECT_TRUE(err.is(ErrorKind::SessionNotFound));
  EXPECT_EQ(std::string(err.what()), "Session not found: abc");
  EXPECT_EQ(err.data()["sessionId"], "abc");
}

TEST(AcpErrorTest, MissingParamMessage) {
  auto err = errors::missing_param("cwd");
  EXPECT_EQ(err.code(), error_codes::kInvalidParams);
  EXPECT_EQ(std::string(err.what()), "Missing required parameter: cwd");
  EXPECT_EQ(err.data()["param"], "cwd");
}

TEST(AcpErrorTest, ParamTypeReportsReceivedType) {
  auto err = errors::param_type("sessionId", "string", json(42));
  EXPECT_EQ(err.data()["expected"], "string");
  EXPECT_EQ(err.data()["received"], "number");
}

TEST(AcpErrorTest, AuthRequiredListsMethods) {
  auto err = errors::auth_required({"api-key", "oauth"});
  EXPECT_EQ(err.code(), -32011);
  EXPECT_NE(std::string(err.what()).find("api-key, oauth"), std::string::npos);
  EXPECT_EQ(err.data()["authMethods"].size(), 2u);
}

TEST(AcpErrorTest, InternalFromKeepsAcpErrors) {
  AcpError original = errors::not_initialized("session/new");
  auto wrapped = errors::internal_from(original);
  EXPECT_TRUE(wrapped.is(ErrorKind::NotInitialized));
}

TEST(AcpErrorTest, InternalFromWrapsOtherExceptions) {
  std::out_of_range cause("index 7");
  auto wrapped = errors::internal_from(cause);
  EXPECT_TRUE(wrapped.is(ErrorKind::InternalError));
  EXPECT_EQ(wrapped.data()["cause"], "index 7");
  EXPECT_NE(wrapped.data()["exception"].get<std::string>().find("out_of_range"), std::string::npos);
}

// ============================================================
// Shared types
// ============================================================

TEST(TypesTest, StopReasonNames) {
  EXPECT_EQ(to_string(StopReason::EndTurn), "end_turn");
  EXPECT_EQ(to_string(StopReason::Cancelled), "cancelled");
  EXPECT_EQ(stop_reason_from_string("aborted"), StopReason::Cancelled);
  EXPECT_EQ(stop_reason_from_string("length"), StopReason::MaxTokens);
  EXPECT_EQ(stop_reason_from_string("stop"), StopReason::EndTurn);
}

TEST(TypesTest, ToolKindFromPiToolName) {
  EXPECT_EQ(tool_kind_from_name("read"), ToolKind::Read);
  EXPECT_EQ(tool_kind_from_name("write"), ToolKind::Edit);
  EXPECT_EQ(tool_kind_from_name("bash"), ToolKind::Execute);
  EXPECT_EQ(tool_kind_from_name("grep"), ToolKind::Search);
  EXPECT_EQ(tool_kind_from_name("custom"), ToolKind::Other);
}

TEST(TypesTest, TruncateNeverSplitsCodePoints) {
  // Four 3-byte characters
  std::string text = "\xE4\xBD\xA0\xE5\xA5\xBD\xE4\xB8\x96\xE7\x95\x8C";
  EXPECT_EQ(truncate_utf8(text, 2), "\xE4\xBD\xA0\xE5\xA5\xBD");
  EXPECT_EQ(truncate_utf8("abc", 80), "abc");
}

TEST(TypesTest, SanitizeReplacesInvalidBytes) {
  EXPECT_EQ(sanitize_utf8("ok\xFFok"), "ok\xEF\xBF\xBDok");
  // Valid multi-byte text passes through
  EXPECT_EQ(sanitize_utf8("\xE4\xBD\xA0 \xF0\x9F\x98\x80"), "\xE4\xBD\xA0 \xF0\x9F\x98\x80");
  // Overlong '/', a surrogate half and a cut-off sequence
  EXPECT_EQ(sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
  EXPECT_EQ(sanitize_utf8("\xED\xA0\x80").substr(0, 3), "\xEF\xBF\xBD");
  EXPECT_EQ(sanitize_utf8("end\xE4\xBD"), "end\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(TypesTest, Trim) {
  EXPECT_EQ(trim("  name \n"), "name");
  EXPECT_EQ(trim(" \t "), "");
}

TEST(UuidTest, Version4Format) {
  auto id = UUID::generate();
  ASSERT_EQ(id.size(), 36u);
  EXPECT_EQ(id[8], '-');
  EXPECT_EQ(id[13], '-');
  EXPECT_EQ(id[14], '4');
  EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
  EXPECT_NE(UUID::generate(), id);
}

TEST(UuidTest, ConnectionId) {
  auto id = UUID::connection_id();
  EXPECT_EQ(id.rfind("conn_", 0), 0u);
  auto last = id.rfind('_');
  EXPECT_EQ(id.size() - last - 1, 9u);
}
