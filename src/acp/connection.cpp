#include "acp/connection.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace piacp::acp {

namespace {

// One thread may sit in a blocking prompt while the other serves control calls
constexpr int kWorkerThreads = 2;

}  // namespace

std::shared_ptr<AcpConnection> AcpConnection::create(std::shared_ptr<net::MessageChannel> channel, BridgeOptions options) {
  std::shared_ptr<AcpConnection> connection(new AcpConnection(std::move(channel)));
  connection->start(std::move(options));
  return connection;
}

AcpConnection::AcpConnection(std::shared_ptr<net::MessageChannel> channel)
    : channel_(std::move(channel)),
      io_(std::make_shared<asio::io_context>()),
      calls_(asio::make_strand(*io_)),
      control_(asio::make_strand(*io_)) {}

void AcpConnection::start(BridgeOptions options) {
  work_.emplace(asio::make_work_guard(*io_));

  // Deferred work queues behind the call that scheduled it
  auto calls = calls_;
  options.defer = [calls](std::function<void()> task) { asio::post(calls, std::move(task)); };
  bridge_ = AcpBridge::create(channel_, std::move(options));

  for (int i = 0; i < kWorkerThreads; ++i) {
    // The io_context outlives this object until its queue drains
    std::thread([io = io_, id = channel_->id()] {
      try {
        io->run();
      } catch (const std::exception& e) {
        spdlog::error("[bridge] worker for {} stopped: {}", id, e.what());
      }
    }).detach();
  }
}

AcpConnection::~AcpConnection() {
  if (work_) {
    work_.reset();
  }
  if (bridge_) {
    bridge_->close();
  }
}

void AcpConnection::on_message(const json& message) {
  auto bridge = bridge_;
  auto& strand = AcpBridge::is_out_of_band(message) ? control_ : calls_;
  asio::post(strand, [bridge, message] { bridge->handle_message(message); });
}

void AcpConnection::on_close() {
  spdlog::debug("[bridge] connection {} closed", channel_->id());
  bridge_->close();
  work_.reset();
}

}  // namespace piacp::acp
