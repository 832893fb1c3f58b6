#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace combatlog {

using TimePoint = std::chrono::system_clock::time_point;
using Millis = std::chrono::milliseconds;

using TraceCallback = std::function<void(const std::string& message)>;
using ProgressCallback = std::function<void(int current, int total)>;

enum class EventKind {
    SessionStart,
    SessionEnd,
    CastSuccess,
    Interrupt,
    Dispel,
    AuraApplied,
    ActorEliminated,
    Other,
};

enum class ParseError {
    TooFewFields,
    BadTimestamp,
    MissingEventKind,
};

struct Event {
    TimePoint timestamp;
    EventKind kind = EventKind::Other;
    std::string actor_id;
    std::string target_id;
    std::vector<std::string> fields; // payload after the event kind token

    const std::string& field(std::size_t i) const {
        static const std::string empty;
        return i < fields.size() ? fields[i] : empty;
    }
};

enum class SessionType {
    Standard,
    ContinuousMultiRound,
};

enum class Boundary {
    Start,
    End,
};

struct SessionMarker {
    TimePoint timestamp;
    Boundary boundary = Boundary::Start;
    SessionType session_type = SessionType::Standard;
    int location_id = 0;
    std::string location_name;
    std::string declared_category;
    std::optional<std::chrono::seconds> reported_duration; // end markers only
};

struct TimeWindow {
    TimePoint begin;
    TimePoint end;

    bool contains(TimePoint t) const { return begin <= t && t <= end; }
};

// Closed interval [start, end]
using Interval = TimeWindow;

struct Candidate {
    SessionMarker start;
    std::optional<SessionMarker> end;
    bool end_synthetic = false;
    int scan_index = 0;
    std::chrono::seconds duration{0};

    double attribute_score = 0.0;
    double zone_id_score = 0.0;
    double proximity_score = 0.0;
    double duration_score = 0.0;
    double cross_source_score = 0.0;
    double composite_score = 0.0;
    int elimination_count = 0;

    bool excluded = false;
    std::string exclusion_reason;

    Interval interval() const {
        return {start.timestamp, end ? end->timestamp : start.timestamp};
    }
};

enum class Reliability {
    High,
    Medium,
    Low,
};

struct GroundTruthEvent {
    std::string actor_id;
    double timestamp_offset = 0.0; // seconds from match start
};

struct MetadataRecord {
    std::string id;
    TimePoint declared_start;
    std::chrono::seconds declared_duration{0};
    std::string declared_category;
    std::string declared_location;
    std::optional<int> zone_id; // authoritative, when the recorder captured it
    std::string primary_actor_id;
    Reliability reliability = Reliability::Medium;
    std::vector<GroundTruthEvent> ground_truth_events;
};

struct FeatureCounters {
    int casts = 0;
    int interrupts_performed = 0;
    int times_interrupted = 0;
    int purges = 0;
    int buff_gained_self = 0;
    int buff_gained_opponent = 0;
    int times_died = 0;
    std::vector<std::string> spells_cast;
    std::vector<std::string> spells_purged;

    std::vector<std::pair<std::string, int>> counters() const {
        return {
            {"cast_success_own", casts},
            {"interrupt_success_own", interrupts_performed},
            {"times_interrupted", times_interrupted},
            {"purges_own", purges},
            {"precog_gained_own", buff_gained_self},
            {"precog_gained_enemy", buff_gained_opponent},
            {"times_died", times_died},
        };
    }

    bool operator==(const FeatureCounters&) const = default;
};

struct ScanStats {
    std::int64_t lines_read = 0;
    std::int64_t lines_in_window = 0;
    std::int64_t lines_skipped = 0;
};

enum class ErrorKind {
    NoBoundaryMarkersFound,
    NoConfidentMatch,
    LogUnreadable,
};

struct ResolveError {
    ErrorKind kind = ErrorKind::NoConfidentMatch;
    std::string message;
};

struct InputError {
    std::string path;
    std::string message;
};

struct Resolution {
    Interval interval;
    Candidate chosen;
    std::vector<Candidate> candidates;
    bool disambiguated = false;
    ScanStats scan;
};

struct MatchFeatures {
    std::string record_id;
    Interval interval;
    double composite_score = 0.0;
    bool disambiguated = false;
    FeatureCounters counters;
};

// Tuning

struct CategoryRule {
    std::string declared;
    std::vector<std::string> accepted;
};

struct ScoringConfig {
    double category_weight = 0.4;
    double location_name_weight = 0.3;
    double zone_id_weight = 0.5;
    double proximity_weight = 0.3;
    double duration_bonus = 0.1;

    std::chrono::seconds max_offset = std::chrono::minutes(20);
    std::chrono::seconds duration_tolerance{300};
    std::chrono::seconds min_plausible_duration{30};
    std::chrono::seconds max_plausible_duration{900};
    std::chrono::seconds max_plausible_continuous{3600};

    double high_confidence = 0.8;
    double competitive_margin = 0.1;
    double min_viable = 0.4;

    double duration_rank_weight = 0.7;
    double cross_source_rank_weight = 0.3;
    // Duration mismatches this close to the best one rank as equal
    std::chrono::seconds duration_tie_band{60};

    std::vector<CategoryRule> category_rules = {
        {"Skirmish", {"2v2", "3v3", "Skirmish"}},
        {"Solo Shuffle", {"Solo Shuffle", "Rated Solo Shuffle"}},
        {"Unranked", {"2v2", "3v3", "Skirmish", "Unranked"}},
    };
};

struct ExtractionRules {
    std::vector<std::string> dispel_spells = {"Devour Magic"};
    std::string tracked_buff = "Precognition";
};

struct ResolverConfig {
    ScoringConfig scoring;
    ExtractionRules extraction;
    std::chrono::seconds search_padding = std::chrono::minutes(10);
    std::chrono::seconds high_reliability_buffer{30};
    std::chrono::seconds medium_reliability_buffer{120};
    std::chrono::seconds low_reliability_buffer{300};
    std::chrono::seconds elimination_tolerance{10};
    std::chrono::minutes log_utc_offset{0};
    std::vector<std::string> continuous_categories = {"Solo Shuffle", "Rated Solo Shuffle"};
};

std::string to_string(ErrorKind kind);

} // namespace combatlog
