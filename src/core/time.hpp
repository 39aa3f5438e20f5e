#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace piacp {

// Parse an ISO-8601 date-time such as 2026-01-01T00:00:01.000Z.
// Accepts a 'Z' or +hh:mm / -hh:mm suffix; a missing offset is read as UTC.
std::optional<Timestamp> parse_iso8601(std::string_view text);

// UTC, millisecond precision: YYYY-MM-DDTHH:MM:SS.mmmZ
std::string format_iso8601(Timestamp tp);

// Parse and re-emit in the canonical form, or nullopt if it does not parse
std::optional<std::string> normalize_iso8601(std::string_view text);

// Milliseconds since the unix epoch
int64_t to_epoch_ms(Timestamp tp);

}  // namespace piacp
