#include "net/ws_server.hpp"

#include <spdlog/spdlog.h>

#include "core/time.hpp"
#include "core/uuid.hpp"

namespace piacp::net {

namespace {

constexpr auto kHandshakeTimeout = std::chrono::seconds(10);
constexpr auto kCloseTimeout = std::chrono::seconds(5);

ConnectionRegistry::TimePoint now() {
  return ConnectionRegistry::Clock::now();
}

}  // namespace

// ============================================================
// WsConnection
// ============================================================

WsConnection::WsConnection(asio::ip::tcp::socket socket, std::shared_ptr<WsServer> server)
    : socket_(std::move(socket)),
      server_(std::move(server)),
      id_(UUID::connection_id()),
      request_buf_(kMaxHandshakeBytes),
      deadline_(socket_.get_executor()),
      pong_timer_(socket_.get_executor()) {
  asio::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  peer_ = ec ? "unknown" : endpoint.address().to_string();
}

void WsConnection::start() {
  auto self = shared_from_this();
  asio::dispatch(socket_.get_executor(), [self] {
    self->deadline_.expires_after(kHandshakeTimeout);
    self->deadline_.async_wait([self](const asio::error_code& ec) {
      if (!ec) self->finish("handshake timeout");
    });
    self->read_request();
  });
}

void WsConnection::read_request() {
  auto self = shared_from_this();
  asio::async_read_until(socket_, request_buf_, "\r\n\r\n", [self](const asio::error_code& ec, size_t n) {
    if (self->finished_) return;
    if (ec) {
      if (ec == asio::error::not_found) {
        self->respond_and_finish(http_response(431, "Request Header Fields Too Large", {}));
      } else {
        self->finish(ec.message());
      }
      return;
    }

    auto data = self->request_buf_.data();
    std::string bytes(asio::buffers_begin(data), asio::buffers_end(data));
    self->request_buf_.consume(self->request_buf_.size());

    // A client may pipeline its first frames behind the upgrade request
    self->inbox_ = bytes.substr(n);
    self->handle_request(bytes.substr(0, n));
  });
}

void WsConnection::handle_request(const std::string& head) {
  auto request = parse_http_request(head);
  if (!request) {
    respond_and_finish(http_response(400, "Bad Request", {{"Content-Type", "text/plain"}}, "Bad request"));
    return;
  }

  if (request->is_websocket_upgrade()) {
    if (request->method != "GET" || request->header("sec-websocket-key").empty() ||
        trim(request->header("sec-websocket-version")) != "13") {
      respond_and_finish(http_response(400, "Bad Request", {{"Content-Type", "text/plain"}}, "Bad WebSocket handshake"));
      return;
    }
    accept_upgrade(*request);
    return;
  }

  if (request->method == "GET" && request->path() == "/health") {
    respond_and_finish(http_response(200, "OK", {{"Content-Type", "application/json"}}, server_->health().dump()));
    return;
  }

  respond_and_finish(http_response(404, "Not Found", {{"Content-Type", "text/plain"}}, "Not found"));
}

void WsConnection::accept_upgrade(const HttpRequest& request) {
  deadline_.cancel();
  write(upgrade_response(websocket_accept(trim(request.header("sec-websocket-key")))));

  if (!server_->is_running()) {
    do_close(close_codes::kGoingAway, "Server shutting down");
    read_frames();
    return;
  }

  if (!server_->registry().admit(id_, now())) {
    spdlog::warn("[ws] Max connections ({}) reached. Rejecting {} from {}", server_->settings().max_connections, id_, peer_);
    do_close(close_codes::kTryAgainLater, "Server overloaded");
    read_frames();
    return;
  }

  open_ = true;
  server_->track(shared_from_this());
  spdlog::info("[ws] New connection {} from {}. Total: {}", id_, peer_, server_->connection_count());

  try {
    handler_ = server_->factory_(shared_from_this());
  } catch (const std::exception& e) {
    spdlog::error("[ws] Could not set up connection {}: {}", id_, e.what());
    server_->registry().remove(id_);
    do_close(close_codes::kInternalError, "Internal error");
  }

  process_input();
  read_frames();
}

void WsConnection::respond_and_finish(std::string response) {
  deadline_.cancel();
  finish_after_write_ = true;
  write(std::move(response));
}

void WsConnection::read_frames() {
  if (finished_) return;
  auto self = shared_from_this();
  socket_.async_read_some(asio::buffer(chunk_), [self](const asio::error_code& ec, size_t n) {
    if (self->finished_) return;
    if (ec) {
      self->finish(ec == asio::error::eof ? "peer closed" : ec.message());
      return;
    }
    if (!self->input_failed_) {
      self->inbox_.append(self->chunk_.data(), n);
      self->process_input();
    }
    self->read_frames();
  });
}

void WsConnection::process_input() {
  while (!finished_ && !input_failed_) {
    auto parsed = try_parse_frame(inbox_);
    if (parsed.status == ParseStatus::Incomplete) break;

    if (parsed.status == ParseStatus::Error) {
      spdlog::warn("[ws] Connection {} protocol error: {}", id_, parsed.error);
      input_failed_ = true;
      inbox_.clear();
      server_->registry().remove(id_);
      do_close(parsed.close_code, parsed.error);
      return;
    }

    inbox_.erase(0, parsed.consumed);
    handle_frame(parsed.frame);
  }
}

void WsConnection::handle_frame(const Frame& frame) {
  switch (frame.opcode) {
    case Opcode::Close: {
      if (close_sent_) {
        finish("close handshake complete");
        return;
      }
      auto peer_close = parse_close_payload(frame.payload);
      uint16_t code = close_codes::kNormal;
      if (peer_close && peer_close->first != 1005) code = peer_close->first;
      close_sent_ = true;
      open_ = false;
      server_->registry().remove(id_);
      finish_after_write_ = true;
      write(encode_frame(Opcode::Close, encode_close_payload(code, "")));
      return;
    }
    case Opcode::Ping:
      if (!close_sent_) write(encode_frame(Opcode::Pong, frame.payload));
      return;
    case Opcode::Pong:
      pong_timer_.cancel();
      server_->registry().on_pong(id_, now());
      return;
    default:
      break;
  }

  if (close_sent_) return;

  auto message = assembler_.feed(frame);
  if (assembler_.failed()) {
    spdlog::warn("[ws] Connection {}: {}", id_, assembler_.error());
    server_->registry().remove(id_);
    do_close(assembler_.close_code(), assembler_.error());
    return;
  }
  if (message) {
    handle_message(*message);
  }
}

void WsConnection::handle_message(const std::string& text) {
  if (!handler_) return;

  auto verdict = server_->registry().on_message(id_, now());
  if (verdict == MessageVerdict::Unknown) return;
  if (verdict == MessageVerdict::RateLimited) {
    spdlog::warn("[ws] Rate limit exceeded for connection {}", id_);
    server_->registry().remove(id_);
    do_close(close_codes::kPolicyViolation, "Rate limit exceeded");
    return;
  }

  auto msg = json::parse(text, nullptr, false);
  if (msg.is_discarded()) {
    spdlog::debug("[ws] Connection {} sent a malformed frame", id_);
    return;
  }
  if (msg.is_object() && msg.contains("type") && msg["type"].is_string()) {
    const auto& type = msg["type"].get_ref<const std::string&>();
    if (type == "ping" || type == "pong") return;
  }

  try {
    handler_->on_message(msg);
  } catch (const std::exception& e) {
    spdlog::error("[ws] Connection {} handler failed: {}", id_, e.what());
  }
}

void WsConnection::send(const json& message) {
  auto text = message.dump(-1, ' ', false, json::error_handler_t::replace);
  auto self = shared_from_this();
  asio::post(socket_.get_executor(), [self, text = std::move(text)] {
    if (!self->open_ || self->close_sent_) return;
    self->server_->registry().touch(self->id_, now());
    self->write(encode_frame(Opcode::Text, text));
  });
}

void WsConnection::close(uint16_t code, const std::string& reason) {
  auto self = shared_from_this();
  asio::post(socket_.get_executor(), [self, code, reason] { self->do_close(code, reason); });
}

void WsConnection::send_ping(uint64_t round, std::chrono::milliseconds pong_timeout) {
  auto self = shared_from_this();
  asio::post(socket_.get_executor(), [self, round, pong_timeout] {
    if (self->close_sent_ || self->finished_) return;
    if (!self->socket_.is_open()) {
      self->server_->registry().remove(self->id_);
      self->do_close(close_codes::kInternalError, "Ping failed");
      return;
    }

    self->write(encode_frame(Opcode::Ping, {}));
    self->pong_timer_.expires_after(pong_timeout);
    self->pong_timer_.async_wait([self, round](const asio::error_code& ec) {
      if (ec) return;
      if (self->server_->registry().on_pong_timeout(self->id_, round)) {
        spdlog::warn("[ws] Connection {} pong timeout. Closing.", self->id_);
        self->do_close(close_codes::kPongTimeout, "Pong timeout");
      }
    });
  });
}

void WsConnection::write(std::string bytes) {
  outbox_.push_back(std::move(bytes));
  if (!writing_) do_write();
}

void WsConnection::do_write() {
  if (finished_) return;
  if (outbox_.empty()) {
    writing_ = false;
    if (finish_after_write_) finish("response sent");
    return;
  }

  writing_ = true;
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(outbox_.front()), [self](const asio::error_code& ec, size_t) {
    if (ec) {
      self->finish("write failed: " + ec.message());
      return;
    }
    self->outbox_.pop_front();
    self->do_write();
  });
}

void WsConnection::do_close(uint16_t code, const std::string& reason) {
  if (close_sent_ || finished_) return;
  close_sent_ = true;
  open_ = false;
  pong_timer_.cancel();

  spdlog::debug("[ws] Closing {} with {} {}", id_, code, reason);
  write(encode_frame(Opcode::Close, encode_close_payload(code, reason)));

  // The peer has a bounded time to answer the close frame
  auto self = shared_from_this();
  deadline_.expires_after(kCloseTimeout);
  deadline_.async_wait([self](const asio::error_code& ec) {
    if (!ec) self->finish("close timeout");
  });
}

void WsConnection::finish(const std::string& why) {
  if (finished_) return;
  finished_ = true;
  open_ = false;

  deadline_.cancel();
  pong_timer_.cancel();
  asio::error_code ignored;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
  outbox_.clear();

  server_->registry().remove(id_);
  server_->forget(id_);

  if (handler_) {
    spdlog::info("[ws] Connection {} disconnected ({}). Total: {}", id_, why, server_->connection_count());
    auto handler = std::move(handler_);
    try {
      handler->on_close();
    } catch (const std::exception& e) {
      spdlog::error("[ws] Connection {} close handler failed: {}", id_, e.what());
    }
  }
}

// ============================================================
// WsServer
// ============================================================

std::shared_ptr<WsServer> WsServer::create(asio::io_context& io, ServerSettings settings, ChannelHandlerFactory factory) {
  return std::shared_ptr<WsServer>(new WsServer(io, std::move(settings), std::move(factory)));
}

WsServer::WsServer(asio::io_context& io, ServerSettings settings, ChannelHandlerFactory factory)
    : io_(io),
      strand_(asio::make_strand(io)),
      settings_(std::move(settings)),
      factory_(std::move(factory)),
      registry_(ConnectionPolicy::from_settings(settings_)),
      acceptor_(strand_),
      ping_timer_(strand_),
      idle_timer_(strand_) {}

void WsServer::start() {
  asio::ip::tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(settings_.host, std::to_string(settings_.port));
  asio::ip::tcp::endpoint endpoint = endpoints.begin()->endpoint();

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(asio::socket_base::max_listen_connections);

  port_ = acceptor_.local_endpoint().port();
  started_at_ = std::chrono::steady_clock::now();
  running_ = true;

  spdlog::info("[ws] Server listening on {}:{}", settings_.host, port_.load());
  spdlog::info("[ws] Health endpoint: http://{}:{}/health", settings_.host, port_.load());

  auto self = shared_from_this();
  asio::post(strand_, [self] {
    self->do_accept();
    self->schedule_ping();
    self->schedule_idle_check();
  });
}

void WsServer::stop() {
  auto self = shared_from_this();
  asio::dispatch(strand_, [self] { self->do_stop(); });
}

json WsServer::health() const {
  auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_);
  return json{{"status", "healthy"},
              {"connections", registry_.size()},
              {"maxConnections", settings_.max_connections},
              {"uptime", uptime.count()},
              {"timestamp", format_iso8601(std::chrono::system_clock::now())}};
}

void WsServer::do_accept() {
  auto self = shared_from_this();
  acceptor_.async_accept(asio::make_strand(io_), [self](const asio::error_code& ec, asio::ip::tcp::socket socket) {
    if (!self->running_) return;
    if (ec) {
      if (ec == asio::error::operation_aborted) return;
      spdlog::warn("[ws] accept failed: {}", ec.message());
    } else {
      std::make_shared<WsConnection>(std::move(socket), self)->start();
    }
    self->do_accept();
  });
}

void WsServer::schedule_ping() {
  if (!running_) return;
  auto self = shared_from_this();
  ping_timer_.expires_after(std::chrono::milliseconds(settings_.ping_interval_ms));
  ping_timer_.async_wait([self](const asio::error_code& ec) {
    if (ec || !self->running_) return;
    self->on_ping_round();
    self->schedule_ping();
  });
}

void WsServer::schedule_idle_check() {
  if (!running_) return;
  auto self = shared_from_this();
  idle_timer_.expires_after(std::chrono::milliseconds(settings_.idle_check_interval_ms));
  idle_timer_.async_wait([self](const asio::error_code& ec) {
    if (ec || !self->running_) return;
    self->on_idle_check();
    self->schedule_idle_check();
  });
}

void WsServer::on_ping_round() {
  auto round = registry_.begin_probe_round();
  for (const auto& id : round.expired) {
    spdlog::warn("[ws] Connection {} ping timeout. Closing.", id);
    if (auto connection = find(id)) connection->close(close_codes::kPingTimeout, "Ping timeout");
  }

  auto pong_timeout = std::chrono::milliseconds(settings_.pong_timeout_ms);
  for (const auto& id : round.probed) {
    if (auto connection = find(id)) {
      connection->send_ping(round.round, pong_timeout);
    } else {
      registry_.remove(id);
    }
  }
}

void WsServer::on_idle_check() {
  for (const auto& id : registry_.sweep_idle(now())) {
    spdlog::info("[ws] Connection {} idle for more than {}s. Closing.", id, settings_.idle_timeout_ms / 1000);
    if (auto connection = find(id)) connection->close(close_codes::kIdleTimeout, "Idle timeout");
  }
}

void WsServer::do_stop() {
  if (!running_.exchange(false)) return;

  ping_timer_.cancel();
  idle_timer_.cancel();
  asio::error_code ignored;
  acceptor_.close(ignored);

  std::vector<std::shared_ptr<WsConnection>> open;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, weak] : connections_) {
      if (auto connection = weak.lock()) open.push_back(connection);
    }
  }

  spdlog::info("[ws] Closing {} connections...", open.size());
  for (const auto& connection : open) {
    registry_.remove(connection->id());
    connection->close(close_codes::kGoingAway, "Server shutting down");
  }
}

void WsServer::track(const std::shared_ptr<WsConnection>& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[connection->id()] = connection;
}

void WsServer::forget(const ConnectionId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_.erase(id);
}

std::shared_ptr<WsConnection> WsServer::find(const ConnectionId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : it->second.lock();
}

}  // namespace piacp::net
