#include <gtest/gtest.h>

#include "acp/jsonrpc.hpp"
#include "acp/protocol.hpp"

using namespace piacp;
using namespace piacp::acp;

// ============================================================
// JsonRpcMessage::classify
// ============================================================

TEST(JsonRpcTest, Request) {
  auto msg = JsonRpcMessage::classify({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", {{"protocolVersion", 1}}}});
  EXPECT_TRUE(msg.is_request());
  EXPECT_EQ(msg.id, 1);
  EXPECT_EQ(msg.method, "initialize");
  EXPECT_EQ(msg.params["protocolVersion"], 1);
}

TEST(JsonRpcTest, StringIdRequest) {
  auto msg = JsonRpcMessage::classify({{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "session/list"}});
  EXPECT_TRUE(msg.is_request());
  EXPECT_EQ(msg.id, "abc");
  EXPECT_TRUE(msg.params.is_object());
}

TEST(JsonRpcTest, NotificationHasNoId) {
  auto msg = JsonRpcMessage::classify({{"jsonrpc", "2.0"}, {"method", "session/cancel"}, {"params", {{"sessionId", "s"}}}});
  EXPECT_TRUE(msg.is_notification());
  EXPECT_TRUE(msg.id.is_null());
}

TEST(JsonRpcTest, Response) {
  auto msg = JsonRpcMessage::classify({{"jsonrpc", "2.0"}, {"id", 7}, {"result", json::object()}});
  EXPECT_EQ(msg.kind, MessageKind::Response);
  EXPECT_EQ(msg.id, 7);
}

TEST(JsonRpcTest, InvalidEnvelopes) {
  EXPECT_EQ(JsonRpcMessage::classify(json::array()).kind, MessageKind::Invalid);
  EXPECT_EQ(JsonRpcMessage::classify({{"id", 1}, {"method", "x"}}).kind, MessageKind::Invalid);
  EXPECT_EQ(JsonRpcMessage::classify({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "x"}}).kind, MessageKind::Invalid);
  EXPECT_EQ(JsonRpcMessage::classify({{"jsonrpc", "2.0"}, {"id", 1}}).kind, MessageKind::Invalid);
  EXPECT_EQ(JsonRpcMessage::classify({{"jsonrpc", "2.0"}, {"id", 1}, {"method", 5}}).kind, MessageKind::Invalid);
  EXPECT_EQ(JsonRpcMessage::classify({{"jsonrpc", "2.0"}, {"id", json::array()}, {"method", "x"}}).kind, MessageKind::Invalid);
  EXPECT_EQ(JsonRpcMessage::classify({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "x"}, {"params", "str"}}).kind, MessageKind::Invalid);
}

// ============================================================
// Envelope builders
// ============================================================

TEST(JsonRpcTest, MakeError) {
  auto j = make_error(3, errors::method_not_found("foo/bar"));
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["id"], 3);
  EXPECT_EQ(j["error"]["code"], -32601);
  EXPECT_EQ(j["error"]["data"]["method"], "foo/bar");
}

TEST(JsonRpcTest, MakeNotification) {
  auto j = make_notification("session/update", {{"sessionId", "s"}});
  EXPECT_FALSE(j.contains("id"));
  EXPECT_EQ(j["method"], "session/update");
}

TEST(JsonRpcTest, RequireString) {
  json params = {{"cwd", "/w"}, {"n", 3}};
  EXPECT_EQ(require_string(params, "cwd"), "/w");

  try {
    require_string(params, "sessionId");
    FAIL() << "expected InvalidParams";
  } catch (const AcpError& e) {
    EXPECT_TRUE(e.is(ErrorKind::InvalidParams));
    EXPECT_EQ(e.data()["reason"], "missing");
  }

  try {
    require_string(params, "n");
    FAIL() << "expected InvalidParams";
  } catch (const AcpError& e) {
    EXPECT_EQ(e.data()["reason"], "type_mismatch");
  }

  EXPECT_FALSE(optional_string(params, "missing").has_value());
  EXPECT_EQ(optional_string(params, "cwd"), "/w");
}

// ============================================================
// session/update payloads
// ============================================================

TEST(ProtocolTest, SessionUpdateEnvelope) {
  auto j = session_update("s1", updates::agent_message_chunk("hi"));
  EXPECT_EQ(j["method"], methods::kSessionUpdate);
  EXPECT_EQ(j["params"]["sessionId"], "s1");
  EXPECT_EQ(j["params"]["update"]["sessionUpdate"], "agent_message_chunk");
  EXPECT_EQ(j["params"]["update"]["content"]["type"], "text");
  EXPECT_EQ(j["params"]["update"]["content"]["text"], "hi");
}

TEST(ProtocolTest, ThoughtAndUserChunks) {
  EXPECT_EQ(updates::agent_thought_chunk("t")["sessionUpdate"], "agent_thought_chunk");
  EXPECT_EQ(updates::user_message_chunk("u")["sessionUpdate"], "user_message_chunk");
}

TEST(ProtocolTest, SessionInfoUpdate) {
  auto update = updates::session_info_update("Renamed");
  EXPECT_EQ(update["sessionUpdate"], "session_info_update");
  EXPECT_EQ(update["title"], "Renamed");
}

TEST(ProtocolTest, TextToolContent) {
  auto content = text_tool_content("out");
  ASSERT_TRUE(content.is_array());
  ASSERT_EQ(content.size(), 1u);
  EXPECT_EQ(content[0]["type"], "content");
  EXPECT_EQ(content[0]["content"]["text"], "out");
}
