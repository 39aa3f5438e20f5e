#include <gtest/gtest.h>
#include <unistd.h>

#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>

#include "pi/rpc_process.hpp"

using namespace piacp;

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Speaks just enough of pi's RPC protocol for these tests
const char* kFakePi = R"SH(#!/bin/sh
echo "$@" > args.txt
while IFS= read -r line; do
  id=$(printf '%s' "$line" | sed -n 's/.*"id":"\([^"]*\)".*/\1/p')
  case "$line" in
    *'"type":"get_state"'*)
      printf '{"type":"response","id":"%s","command":"get_state","success":true,"data":{"sessionId":"abc"}}\n' "$id" ;;
    *'"type":"get_messages"'*)
      printf 'not json at all\n'
      printf '{"type":"response","id":"%s","command":"get_messages","success":true}\n' "$id" ;;
    *'"type":"set_session_name"'*)
      printf '{"type":"response","id":"%s","command":"set_session_name","success":false,"error":"no session"}\n' "$id" ;;
    *'"type":"prompt"'*)
      printf '{"type":"response","id":"%s","command":"prompt","success":true}\n' "$id"
      printf '{"type":"agent_start"}\n'
      printf '{"type":"tool_execution_update","toolCallId":"t1","partialResult":"bad \377 byte"}\n'
      printf '{"type":"agent_end","messages":[]}\n' ;;
    *'"type":"abort"'*)
      exit 3 ;;
  esac
done
)SH";

class EventLog {
 public:
  void add(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    cv_.notify_all();
  }

  // First event of `type`, or null after the timeout
  json wait_for(const std::string& type) {
    std::unique_lock<std::mutex> lock(mutex_);
    json found;
    cv_.wait_for(lock, 5s, [&] {
      for (const auto& event : events_) {
        if (event.value("type", "") == type) {
          found = event;
          return true;
        }
      }
      return false;
    });
    return found;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<json> events_;
};

json get(std::future<json> future) {
  if (future.wait_for(5s) != std::future_status::ready) {
    throw std::runtime_error("timed out");
  }
  return future.get();
}

}  // namespace

class RpcProcessTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("pi_acp_rpc_" + std::to_string(::getpid()) + "_" +
                                        ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    script_ = dir_ / "fake-pi";
    {
      std::ofstream out(script_);
      out << kFakePi;
    }
    fs::permissions(script_, fs::perms::owner_all);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::shared_ptr<PiRpcProcess> spawn() {
    SpawnOptions options;
    options.command = script_.string();
    options.args = {"--no-color"};
    options.cwd = dir_;
    auto process = PiRpcProcess::spawn(options);
    process->on_event([this](const json& event) { events_.add(event); });
    return process;
  }

  fs::path dir_;
  fs::path script_;
  EventLog events_;
};

TEST(RpcProcessArgvTest, BuildArgv) {
  SpawnOptions options;
  options.command = "pi";
  options.args = {"--provider", "anthropic"};
  EXPECT_EQ(PiRpcProcess::build_argv(options), (std::vector<std::string>{"pi", "--mode", "rpc", "--provider", "anthropic"}));

  options.session_file = "/s/a.jsonl";
  EXPECT_EQ(PiRpcProcess::build_argv(options),
            (std::vector<std::string>{"pi", "--mode", "rpc", "--session", "/s/a.jsonl", "--provider", "anthropic"}));
}

TEST_F(RpcProcessTest, RequestResponse) {
  auto process = spawn();
  auto state = get(process->get_state());
  EXPECT_EQ(state["sessionId"], "abc");

  // Started in the requested cwd with the rpc flags
  std::ifstream args(dir_ / "args.txt");
  std::string line;
  std::getline(args, line);
  EXPECT_EQ(line, "--mode rpc --no-color");
}

TEST_F(RpcProcessTest, MissingDataIsEmptyObject) {
  auto process = spawn();
  auto messages = get(process->get_messages());
  EXPECT_TRUE(messages.is_object());
  EXPECT_TRUE(messages.empty());
}

TEST_F(RpcProcessTest, FailedCommandRaises) {
  auto process = spawn();
  try {
    get(process->set_session_name("x"));
    FAIL() << "expected PiRpcError";
  } catch (const PiRpcError& e) {
    EXPECT_STREQ(e.what(), "no session");
  }
}

TEST_F(RpcProcessTest, EventsAreDelivered) {
  auto process = spawn();
  get(process->prompt("hello", {}));
  EXPECT_FALSE(events_.wait_for("agent_start").is_null());
  EXPECT_FALSE(events_.wait_for("agent_end").is_null());
}

TEST_F(RpcProcessTest, InvalidUtf8InEventIsReplaced) {
  auto process = spawn();
  get(process->prompt("hello", {}));
  auto update = events_.wait_for("tool_execution_update");
  ASSERT_FALSE(update.is_null());
  EXPECT_EQ(update["partialResult"], "bad \xEF\xBF\xBD byte");
}

TEST_F(RpcProcessTest, ExitIsReported) {
  auto process = spawn();
  process->abort();

  auto exit = events_.wait_for("process_exit");
  ASSERT_FALSE(exit.is_null());
  EXPECT_EQ(exit["code"], 3);
  EXPECT_TRUE(process->exited());

  EXPECT_THROW(get(process->get_state()), PiRpcError);
}

TEST_F(RpcProcessTest, MissingExecutable) {
  SpawnOptions options;
  options.command = (dir_ / "no-such-pi").string();
  options.cwd = dir_;
  auto process = PiRpcProcess::spawn(options);

  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!process->exited() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_TRUE(process->exited());
  EXPECT_THROW(get(process->get_state()), PiRpcError);
}

TEST_F(RpcProcessTest, ShutdownEndsProcess) {
  auto process = spawn();
  get(process->get_state());
  process->shutdown();
  EXPECT_FALSE(events_.wait_for("process_exit").is_null());
}
