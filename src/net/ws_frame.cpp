#include "net/ws_frame.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <sstream>

#include "core/types.hpp"

namespace piacp::net {

namespace {

constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool valid_opcode(uint8_t op) {
  switch (op) {
    case 0x0:
    case 0x1:
    case 0x2:
    case 0x8:
    case 0x9:
    case 0xA:
      return true;
    default:
      return false;
  }
}

FrameParseResult fail(uint16_t code, std::string error) {
  FrameParseResult result;
  result.status = ParseStatus::Error;
  result.close_code = code;
  result.error = std::move(error);
  return result;
}

}  // namespace

FrameParseResult try_parse_frame(std::string_view buffer, size_t max_payload, bool require_mask) {
  FrameParseResult result;
  if (buffer.size() < 2) return result;

  auto byte = [&](size_t i) { return static_cast<uint8_t>(buffer[i]); };

  const uint8_t b0 = byte(0);
  const uint8_t b1 = byte(1);
  if (b0 & 0x70) {
    return fail(close_codes::kProtocolError, "reserved bits set");
  }
  const uint8_t op = b0 & 0x0F;
  if (!valid_opcode(op)) {
    return fail(close_codes::kProtocolError, "unknown opcode");
  }

  const bool masked = (b1 & 0x80) != 0;
  if (require_mask && !masked) {
    return fail(close_codes::kProtocolError, "unmasked client frame");
  }

  size_t pos = 2;
  uint64_t len = b1 & 0x7F;
  if (len == 126) {
    if (buffer.size() < pos + 2) return result;
    len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
    pos += 2;
  } else if (len == 127) {
    if (buffer.size() < pos + 8) return result;
    len = 0;
    for (size_t i = 0; i < 8; ++i) {
      len = (len << 8) | byte(pos + i);
    }
    pos += 8;
  }

  const bool control = (op & 0x8) != 0;
  const bool fin = (b0 & 0x80) != 0;
  if (control && (len > 125 || !fin)) {
    return fail(close_codes::kProtocolError, "invalid control frame");
  }
  if (len > max_payload) {
    return fail(close_codes::kMessageTooBig, "frame too large");
  }

  std::array<uint8_t, 4> mask{};
  if (masked) {
    if (buffer.size() < pos + 4) return result;
    for (size_t i = 0; i < 4; ++i) {
      mask[i] = byte(pos + i);
    }
    pos += 4;
  }

  if (buffer.size() < pos + len) return result;

  result.frame.fin = fin;
  result.frame.opcode = static_cast<Opcode>(op);
  result.frame.payload.assign(buffer.data() + pos, static_cast<size_t>(len));
  if (masked) {
    for (size_t i = 0; i < result.frame.payload.size(); ++i) {
      result.frame.payload[i] = static_cast<char>(static_cast<uint8_t>(result.frame.payload[i]) ^ mask[i % 4]);
    }
  }
  result.status = ParseStatus::Complete;
  result.consumed = pos + static_cast<size_t>(len);
  return result;
}

std::string encode_frame(Opcode opcode, std::string_view payload, bool fin, std::optional<std::array<uint8_t, 4>> mask) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode)));

  const uint8_t mask_bit = mask ? 0x80 : 0x00;
  const size_t size = payload.size();
  if (size <= 125) {
    frame.push_back(static_cast<char>(mask_bit | size));
  } else if (size <= 0xFFFF) {
    frame.push_back(static_cast<char>(mask_bit | 126));
    frame.push_back(static_cast<char>((size >> 8) & 0xFF));
    frame.push_back(static_cast<char>(size & 0xFF));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((static_cast<uint64_t>(size) >> shift) & 0xFF));
    }
  }

  if (mask) {
    frame.append(reinterpret_cast<const char*>(mask->data()), mask->size());
    for (size_t i = 0; i < size; ++i) {
      frame.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ (*mask)[i % 4]));
    }
  } else {
    frame.append(payload.data(), payload.size());
  }
  return frame;
}

std::string encode_close_payload(uint16_t code, std::string_view reason) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  // Control frame payloads are capped at 125 bytes
  payload.append(truncate_utf8(reason, 123));
  if (payload.size() > 125) payload.resize(125);
  return payload;
}

std::optional<std::pair<uint16_t, std::string>> parse_close_payload(std::string_view payload) {
  if (payload.empty()) return std::make_pair(static_cast<uint16_t>(1005), std::string());
  if (payload.size() < 2) return std::nullopt;
  const uint16_t code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
  return std::make_pair(code, std::string(payload.substr(2)));
}

std::optional<std::string> MessageAssembler::feed(const Frame& frame) {
  if (failed()) return std::nullopt;

  if (frame.opcode == Opcode::Continuation) {
    if (!in_message_) {
      error_ = "continuation without a started message";
      close_code_ = close_codes::kProtocolError;
      return std::nullopt;
    }
  } else {
    if (in_message_) {
      error_ = "new message before the previous one finished";
      close_code_ = close_codes::kProtocolError;
      return std::nullopt;
    }
    buffer_.clear();
    in_message_ = true;
  }

  if (buffer_.size() + frame.payload.size() > max_message_) {
    error_ = "message too large";
    close_code_ = close_codes::kMessageTooBig;
    return std::nullopt;
  }
  buffer_.append(frame.payload);

  if (!frame.fin) return std::nullopt;

  in_message_ = false;
  std::string message;
  message.swap(buffer_);
  return message;
}

std::string websocket_accept(const std::string& client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char*>(source.data()), source.size(), digest.data());

  std::string output(4 * ((digest.size() + 2) / 3), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()), digest.data(), static_cast<int>(digest.size()));
  return output;
}

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::path() const {
  auto q = target.find('?');
  return q == std::string::npos ? target : target.substr(0, q);
}

bool HttpRequest::is_websocket_upgrade() const {
  return to_lower(header("upgrade")) == "websocket" && to_lower(header("connection")).find("upgrade") != std::string::npos;
}

std::optional<HttpRequest> parse_http_request(std::string_view head) {
  HttpRequest request;
  std::istringstream lines{std::string(head)};
  std::string line;

  if (!std::getline(lines, line)) return std::nullopt;
  if (!line.empty() && line.back() == '\r') line.pop_back();
  {
    std::istringstream request_line(line);
    if (!(request_line >> request.method >> request.target >> request.version)) {
      return std::nullopt;
    }
  }
  if (request.version.rfind("HTTP/", 0) != 0) return std::nullopt;

  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) break;
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    request.headers[to_lower(trim(std::string_view(line).substr(0, colon)))] = trim(std::string_view(line).substr(colon + 1));
  }
  return request;
}

std::string http_response(int status, std::string_view status_text, const std::vector<std::pair<std::string, std::string>>& headers,
                          std::string_view body) {
  std::ostringstream response;
  response << "HTTP/1.1 " << status << " " << status_text << "\r\n";
  for (const auto& [k, v] : headers) {
    response << k << ": " << v << "\r\n";
  }
  response << "Content-Length: " << body.size() << "\r\n";
  response << "Connection: close\r\n";
  response << "\r\n";
  response << body;
  return response.str();
}

std::string upgrade_response(const std::string& accept_key) {
  std::string response = "HTTP/1.1 101 Switching Protocols\r\n";
  response += "Upgrade: websocket\r\n";
  response += "Connection: Upgrade\r\n";
  response += "Sec-WebSocket-Accept: " + accept_key + "\r\n";
  response += "\r\n";
  return response;
}

}  // namespace piacp::net
