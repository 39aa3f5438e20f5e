#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace piacp {

// How to start one pi process for a session
struct SpawnOptions {
  std::string command = "pi";
  std::vector<std::string> args;
  std::filesystem::path cwd;
  std::optional<std::filesystem::path> session_file;  // attach to an existing log
};

// Image attached to a prompt (raw base64, no data: prefix)
struct PiImage {
  std::string mime_type;
  std::string data;

  json to_json() const {
    return {{"type", "image"}, {"mimeType", mime_type}, {"data", data}};
  }

  bool operator==(const PiImage& other) const {
    return mime_type == other.mime_type && data == other.data;
  }
};

// A pi command failed, or the process went away before answering
class PiRpcError : public std::runtime_error {
 public:
  explicit PiRpcError(const std::string& message) : std::runtime_error(message) {}
};

// Handle to a running pi agent in RPC mode.
//
// Requests resolve to the response `data` member (an empty object when
// absent) or fail with PiRpcError. Events are delivered on an internal
// thread; handlers must not block for long.
class PiProcess {
 public:
  using SubscriptionId = uint64_t;
  using EventHandler = std::function<void(const json&)>;

  virtual ~PiProcess() = default;

  // Start a turn. Resolves once pi accepted the prompt; the turn itself
  // streams as events until agent_end.
  virtual std::future<json> prompt(const std::string& message, const std::vector<PiImage>& images) = 0;

  // {messages:[...]}
  virtual std::future<json> get_messages() = 0;

  // {models:[{provider, id, name?}]}
  virtual std::future<json> get_available_models() = 0;

  // {model?, thinkingLevel?, steeringMode?, sessionFile?, sessionId?, ...}
  virtual std::future<json> get_state() = 0;

  virtual std::future<json> set_session_name(const std::string& name) = 0;

  // Stop the running turn. Fire and forget.
  virtual void abort() = 0;

  // Answer an extension_ui_request ({id, confirmed|value|cancelled})
  virtual void send_ui_response(const json& response) = 0;

  virtual SubscriptionId on_event(EventHandler handler) = 0;

  virtual void off_event(SubscriptionId id) = 0;

  // Ask the process to exit. Never blocks.
  virtual void shutdown() = 0;
};

using PiProcessFactory = std::function<std::shared_ptr<PiProcess>(const SpawnOptions&)>;

}  // namespace piacp
