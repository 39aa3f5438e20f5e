#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace piacp::net {

// RFC 6455 opcodes
enum class Opcode : uint8_t { Continuation = 0x0, Text = 0x1, Binary = 0x2, Close = 0x8, Ping = 0x9, Pong = 0xA };

// Close codes used by the server
namespace close_codes {
constexpr uint16_t kNormal = 1000;
constexpr uint16_t kGoingAway = 1001;
constexpr uint16_t kProtocolError = 1002;
constexpr uint16_t kPolicyViolation = 1008;
constexpr uint16_t kMessageTooBig = 1009;
constexpr uint16_t kInternalError = 1011;
constexpr uint16_t kTryAgainLater = 1013;
constexpr uint16_t kIdleTimeout = 4000;
constexpr uint16_t kPingTimeout = 4001;
constexpr uint16_t kPongTimeout = 4002;
}  // namespace close_codes

constexpr size_t kMaxHandshakeBytes = 8 * 1024;
constexpr size_t kMaxMessageBytes = 32 * 1024 * 1024;

struct Frame {
  bool fin = true;
  Opcode opcode = Opcode::Text;
  std::string payload;

  bool is_control() const {
    return (static_cast<uint8_t>(opcode) & 0x8) != 0;
  }
};

enum class ParseStatus { Complete, Incomplete, Error };

struct FrameParseResult {
  ParseStatus status = ParseStatus::Incomplete;
  Frame frame;
  size_t consumed = 0;
  uint16_t close_code = 0;  // set on Error
  std::string error;
};

// Parses one frame from the front of buffer. Incomplete means more bytes are
// needed and nothing was consumed. Client-to-server frames must be masked.
FrameParseResult try_parse_frame(std::string_view buffer, size_t max_payload = kMaxMessageBytes, bool require_mask = true);

// Encodes one frame. Server frames are unmasked; pass a mask to encode as a client.
std::string encode_frame(Opcode opcode, std::string_view payload, bool fin = true,
                         std::optional<std::array<uint8_t, 4>> mask = std::nullopt);

std::string encode_close_payload(uint16_t code, std::string_view reason);

// Returns {code, reason}; an empty payload yields 1005 (no status)
std::optional<std::pair<uint16_t, std::string>> parse_close_payload(std::string_view payload);

// Joins fragmented data frames into whole messages
class MessageAssembler {
 public:
  explicit MessageAssembler(size_t max_message = kMaxMessageBytes) : max_message_(max_message) {}

  // Feeds a data frame. Returns the message once the final fragment arrives.
  // Sets error (and close_code) on a protocol violation.
  std::optional<std::string> feed(const Frame& frame);

  bool failed() const {
    return !error_.empty();
  }

  const std::string& error() const {
    return error_;
  }

  uint16_t close_code() const {
    return close_code_;
  }

 private:
  size_t max_message_;
  bool in_message_ = false;
  std::string buffer_;
  std::string error_;
  uint16_t close_code_ = 0;
};

// Sec-WebSocket-Accept for a client key
std::string websocket_accept(const std::string& client_key);

// Parsed HTTP/1.1 request head; header names are lower-cased
struct HttpRequest {
  std::string method;
  std::string target;
  std::string version;
  std::map<std::string, std::string> headers;

  std::string header(const std::string& name) const;

  std::string path() const;

  bool is_websocket_upgrade() const;
};

std::optional<HttpRequest> parse_http_request(std::string_view head);

std::string http_response(int status, std::string_view status_text, const std::vector<std::pair<std::string, std::string>>& headers,
                          std::string_view body = {});

std::string upgrade_response(const std::string& accept_key);

}  // namespace piacp::net
