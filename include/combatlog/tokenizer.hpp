#pragma once

#include "combatlog/types.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace combatlog {

// "M/D/YYYY HH:MM:SS[.fff][-tz]"
std::optional<TimePoint> parse_timestamp(std::string_view text);

// Timestamp prefix of a raw line, without touching the payload.
std::optional<TimePoint> peek_timestamp(std::string_view line);

EventKind peek_event_kind(std::string_view line);

EventKind parse_event_kind(std::string_view token);

std::vector<std::string> split_fields(std::string_view text);

std::expected<Event, ParseError> tokenize_line(std::string_view line);

} // namespace combatlog
