#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace piacp {

// Random identifiers: session ids (when pi reports none) and connection ids
class UUID {
 public:
  // RFC 4122 version 4, lower-case hex
  static std::string generate() {
    std::array<uint8_t, 16> bytes{};
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (auto& b : bytes) {
      b = static_cast<uint8_t>(dist(engine()));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
      if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
      out += hex[bytes[i] >> 4];
      out += hex[bytes[i] & 0x0F];
    }
    return out;
  }

  // [0-9a-z]{length}
  static std::string short_id(size_t length = 8) {
    static const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);
    std::string out(length, '0');
    for (auto& c : out) {
      c = charset[dist(engine())];
    }
    return out;
  }

  // conn_<epoch ms>_<9 random chars>
  static std::string connection_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    return "conn_" + std::to_string(ms) + "_" + short_id(9);
  }

 private:
  static std::mt19937_64& engine() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    return gen;
  }
};

}  // namespace piacp
