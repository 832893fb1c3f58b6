#include "combatlog/tokenizer.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iterator>

namespace combatlog {

namespace {

std::string_view trim_line(std::string_view sv) {
    while (!sv.empty() && (sv.back() == '\r' || sv.back() == '\n' || sv.back() == ' '))
        sv.remove_suffix(1);
    while (!sv.empty() && sv.front() == ' ')
        sv.remove_prefix(1);
    return sv;
}

// Splits "<date> <time>  <KIND>,..." into the timestamp text and the position
// where the event kind begins.
struct Head {
    std::string_view timestamp;
    std::size_t kind_pos = std::string_view::npos;
};

Head split_head(std::string_view line) {
    Head head;
    auto date_end = line.find(' ');
    if (date_end == std::string_view::npos) return head;

    auto time_begin = line.find_first_not_of(' ', date_end);
    if (time_begin == std::string_view::npos) return head;

    auto time_end = line.find_first_of(" \t", time_begin);
    if (time_end == std::string_view::npos) {
        head.timestamp = line;
        return head;
    }

    head.timestamp = line.substr(0, time_end);
    head.kind_pos = line.find_first_not_of(" \t", time_end);
    return head;
}

std::string unquote(std::string_view sv) {
    if (sv.size() >= 2 && sv.front() == '"' && sv.back() == '"') {
        sv = sv.substr(1, sv.size() - 2);
    }
    return std::string(sv);
}

} // namespace

std::optional<TimePoint> parse_timestamp(std::string_view text) {
    text = trim_line(text);
    auto space = text.find(' ');
    if (space == std::string_view::npos) return std::nullopt;

    // Timezone suffix sits on the time token, e.g. "19:03:22.123-4"
    auto tz = text.find_first_of("-+", space);
    if (tz != std::string_view::npos) text = text.substr(0, tz);

    std::string s(text);
    int month = 0, day = 0, year = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (sscanf(s.c_str(), "%d/%d/%d %d:%d:%d%n",
               &month, &day, &year, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60 || year < 1970) {
        return std::nullopt;
    }

    int millis = 0;
    std::string_view rest(s.c_str() + consumed);
    if (!rest.empty()) {
        if (rest.front() != '.' || rest.size() < 2) return std::nullopt;
        int scale = 100;
        for (size_t i = 1; i < rest.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(rest[i]))) return std::nullopt;
            if (scale > 0) {
                millis += (rest[i] - '0') * scale;
                scale /= 10;
            }
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&tm)) + Millis(millis);
}

std::optional<TimePoint> peek_timestamp(std::string_view line) {
    auto head = split_head(trim_line(line));
    if (head.timestamp.empty()) return std::nullopt;
    return parse_timestamp(head.timestamp);
}

EventKind peek_event_kind(std::string_view line) {
    line = trim_line(line);
    auto head = split_head(line);
    if (head.kind_pos == std::string_view::npos) return EventKind::Other;
    auto token = line.substr(head.kind_pos);
    return parse_event_kind(token.substr(0, token.find(',')));
}

EventKind parse_event_kind(std::string_view token) {
    if (token == "ARENA_MATCH_START") return EventKind::SessionStart;
    if (token == "ARENA_MATCH_END") return EventKind::SessionEnd;
    if (token == "SPELL_CAST_SUCCESS") return EventKind::CastSuccess;
    if (token == "SPELL_INTERRUPT") return EventKind::Interrupt;
    if (token == "SPELL_DISPEL") return EventKind::Dispel;
    if (token == "SPELL_AURA_APPLIED") return EventKind::AuraApplied;
    if (token == "UNIT_DIED") return EventKind::ActorEliminated;
    return EventKind::Other;
}

std::vector<std::string> split_fields(std::string_view text) {
    std::vector<std::string> fields;
    bool in_quotes = false;
    size_t begin = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == ',' && !in_quotes) {
            fields.push_back(unquote(text.substr(begin, i - begin)));
            begin = i + 1;
        }
    }
    fields.push_back(unquote(text.substr(begin)));
    return fields;
}

std::expected<Event, ParseError> tokenize_line(std::string_view line) {
    line = trim_line(line);
    auto parts = split_fields(line);
    if (parts.size() < 3) return std::unexpected(ParseError::TooFewFields);

    std::string_view first = parts.front();
    auto head = split_head(first);
    if (head.timestamp.empty()) return std::unexpected(ParseError::BadTimestamp);

    auto ts = parse_timestamp(head.timestamp);
    if (!ts) return std::unexpected(ParseError::BadTimestamp);
    if (head.kind_pos == std::string_view::npos) {
        return std::unexpected(ParseError::MissingEventKind);
    }

    Event event;
    event.timestamp = *ts;
    event.kind = parse_event_kind(first.substr(head.kind_pos));
    event.fields.assign(std::make_move_iterator(parts.begin() + 1),
                        std::make_move_iterator(parts.end()));
    event.actor_id = event.field(1);
    event.target_id = event.field(5);
    return event;
}

} // namespace combatlog
