#pragma once

#include <functional>
#include <memory>
#include <string>

#include "core/types.hpp"

namespace piacp::net {

// Outgoing half of an accepted connection. Thread-safe; sends after close are dropped.
class MessageChannel {
 public:
  virtual ~MessageChannel() = default;

  virtual void send(const json& message) = 0;

  virtual void close(uint16_t code, const std::string& reason) = 0;

  virtual bool is_open() const = 0;

  virtual const ConnectionId& id() const = 0;
};

// Incoming half: what the transport feeds for each accepted connection.
// on_message is called on the I/O thread and must not block.
class ChannelHandler {
 public:
  virtual ~ChannelHandler() = default;

  virtual void on_message(const json& message) = 0;

  // Called once, after which no more messages arrive
  virtual void on_close() = 0;
};

using ChannelHandlerFactory = std::function<std::shared_ptr<ChannelHandler>(std::shared_ptr<MessageChannel>)>;

}  // namespace piacp::net
