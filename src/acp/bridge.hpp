#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "acp/commands.hpp"
#include "acp/tool_calls.hpp"
#include "core/types.hpp"
#include "net/message_channel.hpp"
#include "pi/pi_process.hpp"

namespace piacp::acp {

// Per-connection protocol state
enum class BridgeState { Uninitialized, Initialized, SessionActive, Prompting, Closed };

std::string to_string(BridgeState state);

struct BridgeOptions {
  std::filesystem::path sessions_dir;
  std::filesystem::path agent_dir;

  // Command and args; cwd and session file are filled in per session
  SpawnOptions spawn;

  std::chrono::milliseconds request_timeout{30000};
  std::chrono::milliseconds user_input_timeout{300000};

  // How long a cancelled prompt waits for pi to acknowledge the abort
  std::chrono::milliseconds abort_grace{2000};

  // Defaults to PiRpcProcess::spawn
  PiProcessFactory process_factory;

  // Runs work after the current response went out. Defaults to a queue
  // drained at the end of handle_message.
  std::function<void(std::function<void()>)> defer;
};

// ACP over one connection, backed by at most one pi process at a time.
//
// handle_message must be called sequentially. Out-of-band messages
// (cancellation and answers to pending tool interactions) may be handled
// concurrently with an in-flight session/prompt.
class AcpBridge : public std::enable_shared_from_this<AcpBridge> {
 public:
  static std::shared_ptr<AcpBridge> create(std::shared_ptr<net::MessageChannel> channel, BridgeOptions options);

  ~AcpBridge();

  AcpBridge(const AcpBridge&) = delete;
  AcpBridge& operator=(const AcpBridge&) = delete;

  // Handle one inbound JSON-RPC message; responses go to the channel
  void handle_message(const json& message);

  // session/cancel, item/tool/requestApproval, item/tool/requestUserInput
  static bool is_out_of_band(const json& message);

  // Tear down the live session without waiting for its process
  void close();

  BridgeState state() const;

  std::optional<SessionId> session_id() const;

  std::optional<std::string> last_session_cwd() const;

  void set_last_session_cwd(std::string cwd);

 private:
  struct Turn {
    bool done = false;
    bool cancelled = false;
    bool awaited = true;  // false for GenUI-initiated turns
    StopReason stop_reason = StopReason::EndTurn;
    std::optional<std::string> error;
  };

  struct PendingInteraction {
    enum class Kind { Approval, UserInput } kind = Kind::Approval;
    std::string method;
    std::chrono::steady_clock::time_point deadline;
  };

  struct LiveSession {
    uint64_t serial = 0;
    SessionId id;
    std::string cwd;
    std::shared_ptr<PiProcess> process;
    std::vector<AvailableCommand> file_commands;
    ToolCallState tool_calls;
    PiProcess::SubscriptionId subscription = 0;
    std::shared_ptr<Turn> turn;
    size_t orphan_ends = 0;  // agent_end still owed by abandoned aborted turns
    bool exited = false;
    std::map<std::string, PendingInteraction> interactions;
  };

  AcpBridge(std::shared_ptr<net::MessageChannel> channel, BridgeOptions options);

  json dispatch(const std::string& method, const json& params);

  json handle_initialize(const json& params);
  json handle_session_new(const json& params);
  json handle_session_open(const json& params, bool resume);
  json handle_session_list(const json& params);
  void handle_cancel(const json& params);
  json handle_prompt(const json& params);
  json handle_local_command(const SessionId& session_id, const std::shared_ptr<PiProcess>& process, const SlashCommand& command);
  json handle_tool_approval(const json& params);
  json handle_user_input(const json& params);
  json handle_genui_action(const json& params);

  void require_initialized(const std::string& method) const;
  std::shared_ptr<PiProcess> require_process(const SessionId& session_id) const;

  // Spawn pi and subscribe to its events; install() makes it the live session
  std::unique_ptr<LiveSession> spawn_session(const std::string& cwd, const std::optional<std::filesystem::path>& session_file);
  void install(std::unique_ptr<LiveSession> live);
  void retire(std::unique_ptr<LiveSession> live);
  bool is_live(uint64_t serial) const;

  json session_response(const SessionId& session_id, const std::string& cwd, const json& models, const json& state, const json& startup) const;
  std::string startup_info(const json& state, const std::string& cwd) const;

  void on_pi_event(uint64_t serial, const json& event);

  json await(std::future<json> future, const char* what) const;

  void send_update(const SessionId& session_id, const json& update);
  void send(const json& message);
  void defer(std::function<void()> task);
  void flush_deferred();

  std::shared_ptr<net::MessageChannel> channel_;
  BridgeOptions options_;

  mutable std::mutex mutex_;
  std::condition_variable turn_cv_;
  BridgeState state_ = BridgeState::Uninitialized;
  std::unique_ptr<LiveSession> live_;
  uint64_t next_serial_ = 1;
  std::optional<std::string> last_session_cwd_;
  json client_capabilities_ = json::object();

  std::mutex deferred_mutex_;
  std::vector<std::function<void()>> deferred_;
};

}  // namespace piacp::acp
