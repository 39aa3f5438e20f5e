#pragma once

#include <asio.hpp>
#include <memory>
#include <optional>

#include "acp/bridge.hpp"
#include "net/message_channel.hpp"

namespace piacp::acp {

// Runs one AcpBridge behind a transport connection.
//
// Regular calls execute one at a time on a worker strand, so a long
// session/prompt never stalls the I/O thread. Out-of-band calls
// (cancellation, tool interaction answers) use a second strand and can
// overtake an in-flight prompt.
class AcpConnection : public net::ChannelHandler, public std::enable_shared_from_this<AcpConnection> {
 public:
  static std::shared_ptr<AcpConnection> create(std::shared_ptr<net::MessageChannel> channel, BridgeOptions options);

  ~AcpConnection() override;

  void on_message(const json& message) override;

  void on_close() override;

  const std::shared_ptr<AcpBridge>& bridge() const {
    return bridge_;
  }

 private:
  explicit AcpConnection(std::shared_ptr<net::MessageChannel> channel);

  void start(BridgeOptions options);

  std::shared_ptr<net::MessageChannel> channel_;
  std::shared_ptr<asio::io_context> io_;
  asio::strand<asio::io_context::executor_type> calls_;
  asio::strand<asio::io_context::executor_type> control_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::shared_ptr<AcpBridge> bridge_;
};

}  // namespace piacp::acp
