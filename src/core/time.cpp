#include "core/time.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>

namespace piacp {

namespace {

// Read exactly `digits` decimal digits starting at pos
bool read_number(std::string_view text, size_t& pos, size_t digits, int& out) {
  if (pos + digits > text.size()) return false;
  int value = 0;
  for (size_t i = 0; i < digits; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  out = value;
  pos += digits;
  return true;
}

bool expect(std::string_view text, size_t& pos, char c) {
  if (pos < text.size() && text[pos] == c) {
    ++pos;
    return true;
  }
  return false;
}

}  // namespace

std::optional<Timestamp> parse_iso8601(std::string_view text) {
  using namespace std::chrono;

  size_t pos = 0;
  int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
  if (!read_number(text, pos, 4, y) || !expect(text, pos, '-') || !read_number(text, pos, 2, mo) || !expect(text, pos, '-') ||
      !read_number(text, pos, 2, d)) {
    return std::nullopt;
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
    return std::nullopt;
  }
  ++pos;
  if (!read_number(text, pos, 2, h) || !expect(text, pos, ':') || !read_number(text, pos, 2, mi) || !expect(text, pos, ':') ||
      !read_number(text, pos, 2, s)) {
    return std::nullopt;
  }

  // Fractional seconds: keep millisecond precision, ignore the rest
  int64_t millis = 0;
  if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    for (size_t i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }

  int offset_minutes = 0;
  if (pos < text.size()) {
    char c = text[pos];
    if (c == 'Z' || c == 'z') {
      ++pos;
    } else if (c == '+' || c == '-') {
      ++pos;
      int oh = 0, om = 0;
      if (!read_number(text, pos, 2, oh)) return std::nullopt;
      expect(text, pos, ':');
      if (!read_number(text, pos, 2, om)) return std::nullopt;
      offset_minutes = (oh * 60 + om) * (c == '-' ? -1 : 1);
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) return std::nullopt;

  if (h > 23 || mi > 59 || s > 60) return std::nullopt;

  year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;

  auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + milliseconds{millis} - minutes{offset_minutes};
  return time_point_cast<Timestamp::duration>(tp);
}

std::string format_iso8601(Timestamp tp) {
  using namespace std::chrono;

  auto ms_tp = time_point_cast<milliseconds>(tp);
  auto days_tp = floor<days>(ms_tp);
  year_month_day ymd{days_tp};
  auto tod = ms_tp - days_tp;
  auto h = duration_cast<hours>(tod);
  tod -= h;
  auto m = duration_cast<minutes>(tod);
  tod -= m;
  auto s = duration_cast<seconds>(tod);
  tod -= s;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(h.count()), static_cast<int>(m.count()), static_cast<int>(s.count()),
                static_cast<int>(tod.count()));
  return buf;
}

std::optional<std::string> normalize_iso8601(std::string_view text) {
  auto tp = parse_iso8601(text);
  if (!tp) return std::nullopt;
  return format_iso8601(*tp);
}

int64_t to_epoch_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace piacp
