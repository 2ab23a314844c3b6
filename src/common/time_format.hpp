#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace beacon {

// RFC3339 UTC with millisecond precision, e.g. 2026-01-15T10:00:00.123Z
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

// Accepts 'Z' or a +HH:MM / -HH:MM offset and any number of fractional digits
// (sub-nanosecond digits are ignored). Returns nullopt on malformed input.
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(std::string_view s);

} // namespace beacon
