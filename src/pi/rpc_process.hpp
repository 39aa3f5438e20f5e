#pragma once

#include <sys/types.h>

#include <atomic>
#include <map>
#include <mutex>
#include <thread>

#include "pi/pi_process.hpp"

namespace piacp {

// pi started as `<command> --mode rpc [--session <file>] <args...>`,
// speaking newline-delimited JSON on stdin/stdout.
//
//   -> {"id":"req_1","type":"get_state"}
//   <- {"type":"response","id":"req_1","command":"get_state","success":true,"data":{...}}
//   <- {"type":"message_update",...}          (event, no id)
//
// When stdout reaches EOF every pending request fails and a synthetic
// {"type":"process_exit","code":N} event is emitted.
class PiRpcProcess : public PiProcess {
 public:
  // Throws PiRpcError if pipes or fork fail
  static std::shared_ptr<PiRpcProcess> spawn(const SpawnOptions& options);

  // Terminates and reaps the child (SIGTERM, then SIGKILL after a grace period)
  ~PiRpcProcess() override;

  PiRpcProcess(const PiRpcProcess&) = delete;
  PiRpcProcess& operator=(const PiRpcProcess&) = delete;

  std::future<json> prompt(const std::string& message, const std::vector<PiImage>& images) override;
  std::future<json> get_messages() override;
  std::future<json> get_available_models() override;
  std::future<json> get_state() override;
  std::future<json> set_session_name(const std::string& name) override;
  void abort() override;
  void send_ui_response(const json& response) override;

  SubscriptionId on_event(EventHandler handler) override;
  void off_event(SubscriptionId id) override;

  void shutdown() override;

  pid_t pid() const {
    return pid_;
  }

  bool exited() const {
    return exited_.load();
  }

  // argv for the child, without the executable lookup
  static std::vector<std::string> build_argv(const SpawnOptions& options);

 private:
  PiRpcProcess(pid_t pid, int stdin_fd, int stdout_fd);

  // Holds only a weak reference between reads so the last owner can destroy the process
  static void reader_loop(std::weak_ptr<PiRpcProcess> weak);

  std::future<json> request(json command);
  void write_line(const std::string& line);
  void dispatch_line(const std::string& line);
  void handle_eof();
  void fail_pending(const std::string& reason);
  void emit(const json& event);
  int reap(bool block);

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  std::string read_buffer_;

  std::thread reader_;
  std::atomic<bool> exited_{false};
  std::atomic<bool> reaped_{false};
  std::atomic<int> exit_code_{-1};

  std::mutex write_mutex_;

  std::mutex mutex_;
  uint64_t next_request_ = 1;
  std::map<std::string, std::promise<json>> pending_;
  SubscriptionId next_subscription_ = 1;
  std::map<SubscriptionId, EventHandler> handlers_;
};

}  // namespace piacp
