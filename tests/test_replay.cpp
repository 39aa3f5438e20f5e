#include <gtest/gtest.h>

#include "acp/replay.hpp"
#include "acp/tool_calls.hpp"

using namespace piacp;
using namespace piacp::acp;

// ============================================================
// ToolCallState
// ============================================================

TEST(ToolCallStateTest, StartProgressFinish) {
  ToolCallState state;

  auto started = state.start("t1", "bash", {{"command", "ls"}});
  ASSERT_EQ(started.size(), 1u);
  EXPECT_EQ(started[0]["sessionUpdate"], "tool_call");
  EXPECT_EQ(started[0]["toolCallId"], "t1");
  EXPECT_EQ(started[0]["title"], "bash");
  EXPECT_EQ(started[0]["kind"], "execute");
  EXPECT_EQ(started[0]["status"], "in_progress");
  EXPECT_EQ(started[0]["rawInput"]["command"], "ls");

  auto progress = state.progress("t1", "bash", {{"content", {{{"type", "text"}, {"text", "partial"}}}}});
  ASSERT_EQ(progress.size(), 1u);
  EXPECT_EQ(progress[0]["sessionUpdate"], "tool_call_update");
  EXPECT_EQ(progress[0]["content"][0]["content"]["text"], "partial");

  auto finished = state.finish("t1", "bash", {{"content", {{{"type", "text"}, {"text", "a.txt"}}}}}, false);
  ASSERT_EQ(finished.size(), 1u);
  EXPECT_EQ(finished[0]["status"], "completed");
  EXPECT_EQ(finished[0]["content"][0]["content"]["text"], "a.txt");
  EXPECT_TRUE(finished[0].contains("rawOutput"));

  ASSERT_NE(state.find("t1"), nullptr);
  EXPECT_EQ(state.find("t1")->status, ToolCallStatus::Completed);
}

TEST(ToolCallStateTest, LocationsFromPathArgument) {
  ToolCallState state;
  auto started = state.start("t1", "read", {{"path", "src/main.cpp"}});
  EXPECT_EQ(started[0]["kind"], "read");
  EXPECT_EQ(started[0]["locations"][0]["path"], "src/main.cpp");
}

TEST(ToolCallStateTest, FinishUnknownIdSynthesizesToolCall) {
  ToolCallState state;
  auto out = state.finish("ghost", "edit", json("boom"), true);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0]["sessionUpdate"], "tool_call");
  EXPECT_EQ(out[0]["kind"], "edit");
  EXPECT_EQ(out[1]["sessionUpdate"], "tool_call_update");
  EXPECT_EQ(out[1]["status"], "failed");
  EXPECT_EQ(out[1]["content"][0]["content"]["text"], "boom");
  EXPECT_EQ(state.size(), 1u);
}

TEST(ToolCallStateTest, ToolResultText) {
  EXPECT_EQ(tool_result_text(json("plain")), "plain");
  EXPECT_EQ(tool_result_text(json::parse(R"([{"type":"text","text":"a"},{"type":"image"},{"type":"text","text":"b"}])")), "a\nb");
  EXPECT_EQ(tool_result_text(json::parse(R"({"content":"inner"})")), "inner");
  EXPECT_EQ(tool_result_text(json(nullptr)), "");
}

// ============================================================
// replay_messages
// ============================================================

TEST(ReplayTest, HistoryInRecordOrder) {
  auto messages = json::parse(R"([
    {"role":"user","content":[{"type":"text","text":"list files"}]},
    {"role":"assistant","content":[
      {"type":"thinking","thinking":"use ls"},
      {"type":"text","text":"Running ls"},
      {"type":"toolCall","id":"c1","name":"bash","arguments":{"command":"ls"}}
    ]},
    {"role":"toolResult","toolCallId":"c1","toolName":"bash","content":[{"type":"text","text":"a.txt"}],"isError":false},
    {"role":"user","content":"thanks"}
  ])");

  ToolCallState state;
  auto out = replay_messages(messages, state);
  ASSERT_EQ(out.size(), 6u);
  EXPECT_EQ(out[0]["sessionUpdate"], "user_message_chunk");
  EXPECT_EQ(out[0]["content"]["text"], "list files");
  EXPECT_EQ(out[1]["sessionUpdate"], "agent_thought_chunk");
  EXPECT_EQ(out[2]["sessionUpdate"], "agent_message_chunk");
  EXPECT_EQ(out[3]["sessionUpdate"], "tool_call");
  EXPECT_EQ(out[3]["title"], "bash");
  EXPECT_EQ(out[4]["sessionUpdate"], "tool_call_update");
  EXPECT_EQ(out[4]["status"], "completed");
  EXPECT_EQ(out[5]["content"]["text"], "thanks");
}

TEST(ReplayTest, FailedToolResult) {
  auto messages = json::parse(R"([{"role":"toolResult","toolCallId":"c2","toolName":"write","content":[],"isError":true}])");
  ToolCallState state;
  auto out = replay_messages(messages, state);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1]["status"], "failed");
}

TEST(ReplayTest, SkipsMalformedEntries) {
  auto messages = json::parse(R"([1, {"role":"toolResult","content":[]}, {"role":"system","content":"x"}, {"role":"assistant","content":[{"type":"text","text":""}]}])");
  ToolCallState state;
  EXPECT_TRUE(replay_messages(messages, state).empty());
  EXPECT_TRUE(replay_messages(json::object(), state).empty());
}

// ============================================================
// translate_event
// ============================================================

TEST(TranslateEventTest, TextAndThinkingDeltas) {
  ToolCallState state;
  auto text = translate_event(json::parse(R"({"type":"message_update","assistantMessageEvent":{"type":"text_delta","delta":"Hel"}})"), state);
  ASSERT_EQ(text.size(), 1u);
  EXPECT_EQ(text[0]["sessionUpdate"], "agent_message_chunk");
  EXPECT_EQ(text[0]["content"]["text"], "Hel");

  auto thought = translate_event(json::parse(R"({"type":"message_update","assistantMessageEvent":{"type":"thinking_delta","delta":"hmm"}})"), state);
  ASSERT_EQ(thought.size(), 1u);
  EXPECT_EQ(thought[0]["sessionUpdate"], "agent_thought_chunk");

  EXPECT_TRUE(translate_event(json::parse(R"({"type":"message_update","assistantMessageEvent":{"type":"text_start"}})"), state).empty());
}

TEST(TranslateEventTest, ToolExecutionLifecycle) {
  ToolCallState state;
  auto start = translate_event(json::parse(R"({"type":"tool_execution_start","toolCallId":"x","toolName":"grep","args":{"pattern":"foo"}})"), state);
  ASSERT_EQ(start.size(), 1u);
  EXPECT_EQ(start[0]["kind"], "search");

  auto end = translate_event(json::parse(R"({"type":"tool_execution_end","toolCallId":"x","toolName":"grep","result":{"content":[{"type":"text","text":"hit"}]},"isError":false})"), state);
  ASSERT_EQ(end.size(), 1u);
  EXPECT_EQ(end[0]["status"], "completed");
}

TEST(TranslateEventTest, OtherEventsProduceNothing) {
  ToolCallState state;
  EXPECT_TRUE(translate_event(json::parse(R"({"type":"agent_start"})"), state).empty());
  EXPECT_TRUE(translate_event(json::parse(R"({"type":"turn_end"})"), state).empty());
}
