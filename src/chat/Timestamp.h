#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace quichat::chat {

using Timestamp = std::chrono::system_clock::time_point;

// RFC3339 in UTC with nanosecond precision, trailing zeros trimmed:
// 2024-05-01T12:30:00.25Z
std::string format_rfc3339(Timestamp ts);

// Accepts "Z" or a numeric offset, 0-9 fractional digits.
std::optional<Timestamp> parse_rfc3339(std::string_view text);

// Local wall-clock "YYYY-MM-DD HH:MM:SS" for rendering.
std::string format_clock_time(Timestamp ts);

} // namespace quichat::chat
