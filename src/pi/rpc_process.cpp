#include "pi/rpc_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace piacp {

namespace {

constexpr int kReadPollMs = 50;
constexpr auto kTerminateGrace = std::chrono::milliseconds(2000);

std::once_flag g_sigpipe_once;

std::string errno_message(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::future<json> failed_future(const std::string& reason) {
  std::promise<json> promise;
  promise.set_exception(std::make_exception_ptr(PiRpcError(reason)));
  return promise.get_future();
}

}  // namespace

std::vector<std::string> PiRpcProcess::build_argv(const SpawnOptions& options) {
  std::vector<std::string> argv = {options.command, "--mode", "rpc"};
  if (options.session_file) {
    argv.push_back("--session");
    argv.push_back(options.session_file->string());
  }
  argv.insert(argv.end(), options.args.begin(), options.args.end());
  return argv;
}

std::shared_ptr<PiRpcProcess> PiRpcProcess::spawn(const SpawnOptions& options) {
  // A dead child must surface as EPIPE on write, not kill the server
  std::call_once(g_sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

  auto argv_strings = build_argv(options);
  std::vector<char*> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto& arg : argv_strings) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  std::string cwd = options.cwd.string();

  int in_pipe[2];
  int out_pipe[2];
  if (::pipe2(in_pipe, O_CLOEXEC) == -1) {
    throw PiRpcError(errno_message("Failed to create stdin pipe"));
  }
  if (::pipe2(out_pipe, O_CLOEXEC) == -1) {
    int err = errno;
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    errno = err;
    throw PiRpcError(errno_message("Failed to create stdout pipe"));
  }

  pid_t pid = ::fork();
  if (pid == -1) {
    int err = errno;
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) {
      ::close(fd);
    }
    errno = err;
    throw PiRpcError(errno_message("Failed to fork pi process"));
  }

  if (pid == 0) {
    // ---- Child process ----
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);

    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      _exit(127);
    }

    ::signal(SIGPIPE, SIG_DFL);
    ::execvp(argv[0], argv.data());
    _exit(127);  // exec failed
  }

  // ---- Parent process ----
  ::close(in_pipe[0]);
  ::close(out_pipe[1]);

  spdlog::info("[pi] spawned pid={} cwd={} session={}", pid, cwd, options.session_file ? options.session_file->string() : "(new)");

  std::shared_ptr<PiRpcProcess> proc(new PiRpcProcess(pid, in_pipe[1], out_pipe[0]));
  proc->reader_ = std::thread(&PiRpcProcess::reader_loop, std::weak_ptr<PiRpcProcess>(proc));
  return proc;
}

PiRpcProcess::PiRpcProcess(pid_t pid, int stdin_fd, int stdout_fd) : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

PiRpcProcess::~PiRpcProcess() {
  if (reader_.joinable()) {
    if (reader_.get_id() == std::this_thread::get_id()) {
      // Last owner released from inside an event handler
      reader_.detach();
    } else {
      reader_.join();
    }
  }

  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
  }

  if (!reaped_.load()) {
    ::kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    while (!reaped_.load() && std::chrono::steady_clock::now() < deadline) {
      if (reap(false) >= 0 || reaped_.load()) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!reaped_.load()) {
      spdlog::warn("[pi] pid={} ignored SIGTERM, killing", pid_);
      ::kill(pid_, SIGKILL);
      reap(true);
    }
  }

  close_fd(stdout_fd_);
  fail_pending("pi process destroyed");
  spdlog::debug("[pi] pid={} released", pid_);
}

int PiRpcProcess::reap(bool block) {
  if (reaped_.load()) {
    return exit_code_.load();
  }
  int status = 0;
  pid_t ret;
  do {
    ret = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (ret == -1 && errno == EINTR);

  if (ret == pid_) {
    int code = -1;
    if (WIFEXITED(status)) {
      code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      code = 128 + WTERMSIG(status);
    }
    exit_code_ = code;
    reaped_ = true;
    return code;
  }
  if (ret == -1) {
    // ECHILD: already reaped elsewhere
    reaped_ = true;
  }
  return -1;
}

void PiRpcProcess::reader_loop(std::weak_ptr<PiRpcProcess> weak) {
  std::array<char, 8192> buffer;
  while (true) {
    auto self = weak.lock();
    if (!self) {
      return;
    }

    pollfd pfd{self->stdout_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, kReadPollMs);
    if (ready == 0) {
      continue;
    }
    if (ready < 0) {
      if (errno == EINTR) continue;
      spdlog::error("[pi] poll failed: {}", std::strerror(errno));
      self->handle_eof();
      return;
    }

    ssize_t n = ::read(self->stdout_fd_, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      spdlog::error("[pi] read failed: {}", std::strerror(errno));
      self->handle_eof();
      return;
    }
    if (n == 0) {
      self->handle_eof();
      return;
    }

    self->read_buffer_.append(buffer.data(), static_cast<size_t>(n));
    size_t pos;
    while ((pos = self->read_buffer_.find('\n')) != std::string::npos) {
      std::string line = self->read_buffer_.substr(0, pos);
      self->read_buffer_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (!line.empty()) {
        self->dispatch_line(line);
      }
    }
  }
}

void PiRpcProcess::handle_eof() {
  if (!read_buffer_.empty()) {
    std::string rest;
    rest.swap(read_buffer_);
    dispatch_line(rest);
  }

  exited_ = true;

  // stdout closing usually means the child is on its way out
  int code = -1;
  for (int i = 0; i < 25 && !reaped_.load(); ++i) {
    code = reap(false);
    if (code >= 0) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  if (reaped_.load()) {
    code = exit_code_.load();
  }

  spdlog::info("[pi] pid={} exited (code={})", pid_, code);
  fail_pending("pi process exited");

  json event = {{"type", "process_exit"}, {"code", code >= 0 ? json(code) : json(nullptr)}};
  emit(event);
}

void PiRpcProcess::dispatch_line(const std::string& line) {
  // Tool output can carry arbitrary bytes; a stray one must not drop the whole line
  json msg = json::parse(sanitize_utf8(line), nullptr, false);
  if (msg.is_discarded() || !msg.is_object()) {
    spdlog::debug("[pi] ignoring non-JSON output: {}", line.substr(0, 200));
    return;
  }

  if (msg.value("type", "") == "response" && msg.contains("id") && msg["id"].is_string()) {
    std::promise<json> promise;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(msg["id"].get<std::string>());
      if (it == pending_.end()) {
        spdlog::debug("[pi] response for unknown request {}", msg["id"].dump());
        return;
      }
      promise = std::move(it->second);
      pending_.erase(it);
    }

    if (msg.value("success", false)) {
      json data = msg.contains("data") && !msg["data"].is_null() ? msg["data"] : json::object();
      promise.set_value(std::move(data));
    } else {
      std::string error = msg.contains("error") && msg["error"].is_string() ? msg["error"].get<std::string>()
                                                                              : "pi command failed: " + msg.value("command", "unknown");
      promise.set_exception(std::make_exception_ptr(PiRpcError(error)));
    }
    return;
  }

  emit(msg);
}

void PiRpcProcess::emit(const json& event) {
  std::vector<EventHandler> to_call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, handler] : handlers_) {
      to_call.push_back(handler);
    }
  }

  // Call handlers outside the lock
  for (const auto& handler : to_call) {
    try {
      handler(event);
    } catch (const std::exception& e) {
      spdlog::error("[pi] event handler threw on {}: {}", event.value("type", "?"), e.what());
    }
  }
}

void PiRpcProcess::fail_pending(const std::string& reason) {
  std::map<std::string, std::promise<json>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(pending_);
  }
  for (auto& [id, promise] : pending) {
    promise.set_exception(std::make_exception_ptr(PiRpcError(reason)));
  }
}

void PiRpcProcess::write_line(const std::string& line) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (stdin_fd_ < 0) {
    throw PiRpcError("pi stdin is closed");
  }
  std::string data = line + "\n";
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw PiRpcError(errno_message("Failed to write to pi"));
    }
    written += static_cast<size_t>(n);
  }
}

std::future<json> PiRpcProcess::request(json command) {
  if (exited_.load()) {
    return failed_future("pi process exited");
  }

  std::string id;
  std::future<json> future;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = "req_" + std::to_string(next_request_++);
    std::promise<json> promise;
    future = promise.get_future();
    pending_.emplace(id, std::move(promise));
  }
  command["id"] = id;

  try {
    write_line(command.dump());
  } catch (const PiRpcError&) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it != pending_.end()) {
      it->second.set_exception(std::current_exception());
      pending_.erase(it);
    }
  }

  spdlog::debug("[pi] -> {} {}", id, command.value("type", ""));
  return future;
}

std::future<json> PiRpcProcess::prompt(const std::string& message, const std::vector<PiImage>& images) {
  json command = {{"type", "prompt"}, {"message", message}};
  if (!images.empty()) {
    json list = json::array();
    for (const auto& image : images) {
      list.push_back(image.to_json());
    }
    command["images"] = list;
  }
  return request(std::move(command));
}

std::future<json> PiRpcProcess::get_messages() {
  return request({{"type", "get_messages"}});
}

std::future<json> PiRpcProcess::get_available_models() {
  return request({{"type", "get_available_models"}});
}

std::future<json> PiRpcProcess::get_state() {
  return request({{"type", "get_state"}});
}

std::future<json> PiRpcProcess::set_session_name(const std::string& name) {
  return request({{"type", "set_session_name"}, {"name", name}});
}

void PiRpcProcess::abort() {
  try {
    write_line(json{{"type", "abort"}}.dump());
  } catch (const PiRpcError& e) {
    spdlog::warn("[pi] abort not delivered: {}", e.what());
  }
}

void PiRpcProcess::send_ui_response(const json& response) {
  json command = response;
  command["type"] = "extension_ui_response";
  write_line(command.dump());
}

PiProcess::SubscriptionId PiRpcProcess::on_event(EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_subscription_++;
  handlers_.emplace(id, std::move(handler));
  return id;
}

void PiRpcProcess::off_event(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(id);
}

void PiRpcProcess::shutdown() {
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
  }
  if (!reaped_.load()) {
    ::kill(pid_, SIGTERM);
  }
  spdlog::debug("[pi] pid={} shutdown requested", pid_);
}

}  // namespace piacp
