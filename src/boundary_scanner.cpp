#include "combatlog/boundary_scanner.hpp"
#include "combatlog/open_session.hpp"
#include "combatlog/tokenizer.hpp"
#include "combatlog/zones.hpp"
#include <charconv>
#include <string>

namespace combatlog {

namespace {

std::optional<int> to_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::chrono::seconds reliability_buffer(Reliability r, const ResolverConfig& config) {
    switch (r) {
        case Reliability::High: return config.high_reliability_buffer;
        case Reliability::Medium: return config.medium_reliability_buffer;
        case Reliability::Low: return config.low_reliability_buffer;
    }
    return config.medium_reliability_buffer;
}

// ARENA_MATCH_START,zone_id,unknown,bracket,is_ranked
SessionMarker make_start_marker(const Event& event, const ResolverConfig& config) {
    SessionMarker marker;
    marker.timestamp = event.timestamp;
    marker.boundary = Boundary::Start;
    marker.location_id = to_int(event.field(0)).value_or(0);
    marker.location_name = zone_name(marker.location_id);
    marker.declared_category = event.field(2);
    marker.session_type = is_continuous_category(marker.declared_category, config)
                              ? SessionType::ContinuousMultiRound
                              : SessionType::Standard;
    return marker;
}

// ARENA_MATCH_END,winning_team,duration_s,rating_a,rating_b
SessionMarker make_end_marker(const Event& event) {
    SessionMarker marker;
    marker.timestamp = event.timestamp;
    marker.boundary = Boundary::End;
    if (auto secs = to_int(event.field(1))) {
        marker.reported_duration = std::chrono::seconds(*secs);
    }
    return marker;
}

} // namespace

TimeWindow search_window(const MetadataRecord& record, const ResolverConfig& config) {
    auto pad = reliability_buffer(record.reliability, config) + config.search_padding;
    return {
        .begin = record.declared_start - pad,
        .end = record.declared_start + record.declared_duration + pad,
    };
}

std::vector<SessionMarker> scan_boundaries(
    std::istream& log, const TimeWindow& window, const ResolverConfig& config,
    ScanStats* stats) {

    ScanStats local;
    std::vector<SessionMarker> markers;
    std::string line;

    while (std::getline(log, line)) {
        local.lines_read++;

        auto ts = peek_timestamp(line);
        if (!ts) {
            local.lines_skipped++;
            continue;
        }
        if (!window.contains(*ts)) continue;
        local.lines_in_window++;

        auto kind = peek_event_kind(line);
        if (kind != EventKind::SessionStart && kind != EventKind::SessionEnd) continue;

        auto event = tokenize_line(line);
        if (!event) {
            local.lines_skipped++;
            continue;
        }

        if (event->kind == EventKind::SessionStart) {
            markers.push_back(make_start_marker(*event, config));
        } else {
            markers.push_back(make_end_marker(*event));
        }
    }

    if (stats) *stats = local;
    return markers;
}

} // namespace combatlog
