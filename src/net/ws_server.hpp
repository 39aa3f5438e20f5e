#pragma once

#include <array>
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "core/config.hpp"
#include "net/connection_registry.hpp"
#include "net/message_channel.hpp"
#include "net/ws_frame.hpp"

namespace piacp::net {

class WsServer;

// One accepted socket: HTTP request head, then either a plain HTTP reply
// (/health, 404) or a WebSocket session. All state lives on the socket's strand.
class WsConnection : public MessageChannel, public std::enable_shared_from_this<WsConnection> {
 public:
  WsConnection(asio::ip::tcp::socket socket, std::shared_ptr<WsServer> server);

  void start();

  void send(const json& message) override;

  void close(uint16_t code, const std::string& reason) override;

  bool is_open() const override {
    return open_.load();
  }

  const ConnectionId& id() const override {
    return id_;
  }

  // Sends a ping for a liveness round and arms the pong timer
  void send_ping(uint64_t round, std::chrono::milliseconds pong_timeout);

 private:
  void read_request();
  void handle_request(const std::string& head);
  void accept_upgrade(const HttpRequest& request);
  void respond_and_finish(std::string response);

  void read_frames();
  void process_input();
  void handle_frame(const Frame& frame);
  void handle_message(const std::string& text);

  void write(std::string bytes);
  void do_write();
  void do_close(uint16_t code, const std::string& reason);
  void finish(const std::string& why);

  asio::ip::tcp::socket socket_;
  std::shared_ptr<WsServer> server_;
  ConnectionId id_;
  std::string peer_;

  asio::streambuf request_buf_;
  std::array<char, 16 * 1024> chunk_{};
  std::string inbox_;
  MessageAssembler assembler_;
  bool input_failed_ = false;

  std::deque<std::string> outbox_;
  bool writing_ = false;
  bool finish_after_write_ = false;

  std::atomic<bool> open_{false};
  bool close_sent_ = false;
  bool finished_ = false;
  std::shared_ptr<ChannelHandler> handler_;

  asio::steady_timer deadline_;
  asio::steady_timer pong_timer_;
};

// WebSocket transport with a /health endpoint on the same port.
//
// Admission, rate limiting and idle/liveness decisions come from
// ConnectionRegistry; this class owns the sockets and the periodic timers.
class WsServer : public std::enable_shared_from_this<WsServer> {
 public:
  static std::shared_ptr<WsServer> create(asio::io_context& io, ServerSettings settings, ChannelHandlerFactory factory);

  // Binds and listens; throws std::system_error when the address is unusable
  void start();

  // Cancels timers, closes every connection with 1001 and the listener.
  // Safe to call from any thread.
  void stop();

  bool is_running() const {
    return running_.load();
  }

  uint16_t port() const {
    return port_.load();
  }

  size_t connection_count() const {
    return registry_.size();
  }

  json health() const;

  ConnectionRegistry& registry() {
    return registry_;
  }

  const ServerSettings& settings() const {
    return settings_;
  }

 private:
  friend class WsConnection;

  WsServer(asio::io_context& io, ServerSettings settings, ChannelHandlerFactory factory);

  void do_accept();
  void schedule_ping();
  void schedule_idle_check();
  void on_ping_round();
  void on_idle_check();
  void do_stop();

  void track(const std::shared_ptr<WsConnection>& connection);
  void forget(const ConnectionId& id);
  std::shared_ptr<WsConnection> find(const ConnectionId& id) const;

  asio::io_context& io_;
  asio::strand<asio::io_context::executor_type> strand_;
  ServerSettings settings_;
  ChannelHandlerFactory factory_;
  ConnectionRegistry registry_;

  asio::ip::tcp::acceptor acceptor_;
  asio::steady_timer ping_timer_;
  asio::steady_timer idle_timer_;

  std::chrono::steady_clock::time_point started_at_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> port_{0};

  mutable std::mutex mutex_;
  std::map<ConnectionId, std::weak_ptr<WsConnection>> connections_;
};

}  // namespace piacp::net
