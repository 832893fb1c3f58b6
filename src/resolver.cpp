#include "combatlog/resolver.hpp"
#include "combatlog/boundary_scanner.hpp"
#include "combatlog/candidate_builder.hpp"
#include "combatlog/disambiguator.hpp"
#include "combatlog/feature_extractor.hpp"
#include "combatlog/open_session.hpp"
#include "combatlog/scorer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace combatlog {

namespace {

std::string f2(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string describe(const Candidate& c) {
    std::string s = "  candidate #" + std::to_string(c.scan_index) + " " +
                    c.start.declared_category + " on " + c.start.location_name +
                    " (zone " + std::to_string(c.start.location_id) + ")" +
                    " duration=" + std::to_string(c.duration.count()) + "s" +
                    (c.end_synthetic ? " [synthetic end]" : "") +
                    " attr=" + f2(c.attribute_score) +
                    " zone=" + f2(c.zone_id_score) +
                    " prox=" + f2(c.proximity_score) +
                    " composite=" + f2(c.composite_score);
    if (c.excluded) s += " excluded: " + c.exclusion_reason;
    return s;
}

void rewind(std::istream& log) {
    log.clear();
    log.seekg(0);
}

} // namespace

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoBoundaryMarkersFound: return "NoBoundaryMarkersFound";
        case ErrorKind::NoConfidentMatch: return "NoConfidentMatch";
        case ErrorKind::LogUnreadable: return "LogUnreadable";
    }
    return "Unknown";
}

std::expected<Resolution, ResolveError> resolve_interval(
    std::istream& log, const MetadataRecord& record, const ResolverConfig& config,
    const TraceCallback& trace) {

    rewind(log);
    Resolution resolution;
    auto window = search_window(record, config);
    auto markers = scan_boundaries(log, window, config, &resolution.scan);

    if (trace) {
        trace("record " + record.id + ": " + std::to_string(markers.size()) +
              " session markers, " + std::to_string(resolution.scan.lines_skipped) +
              " unparsable lines");
    }

    if (markers.empty()) {
        return std::unexpected(ResolveError{
            ErrorKind::NoBoundaryMarkersFound,
            "no session markers inside the search window for " + record.id});
    }

    auto candidates = build_candidates(std::move(markers));
    if (candidates.empty()) {
        return std::unexpected(ResolveError{
            ErrorKind::NoBoundaryMarkersFound,
            "only end markers inside the search window for " + record.id});
    }

    if (is_continuous_category(record.declared_category, config)) {
        for (auto& c : candidates) {
            if (c.start.session_type == SessionType::ContinuousMultiRound)
                synthesize_open_end(c, record.declared_duration);
        }
    }

    candidates = score_candidates(std::move(candidates), record, config.scoring);
    if (trace) {
        for (auto& c : candidates) trace(describe(c));
    }

    size_t chosen = 0;
    if (auto winner = confident_winner(candidates, config.scoring)) {
        chosen = *winner;
        if (trace) trace("  high-confidence winner #" + std::to_string(candidates[chosen].scan_index));
    } else {
        auto competitive = competitive_set(candidates, config.scoring);
        rewind(log);
        auto picked = disambiguate(log, candidates, competitive, record, config, trace);
        if (!picked) {
            picked.error().message += " (" + record.id + ")";
            return std::unexpected(picked.error());
        }
        chosen = *picked;
        resolution.disambiguated = true;
    }

    resolution.chosen = candidates[chosen];
    resolution.interval = resolution.chosen.interval();
    resolution.candidates = std::move(candidates);
    return resolution;
}

std::expected<MatchFeatures, ResolveError> resolve_and_extract(
    std::istream& log, const MetadataRecord& record, const OwnershipIndex& index,
    const ResolverConfig& config, const TraceCallback& trace) {

    auto resolution = resolve_interval(log, record, config, trace);
    if (!resolution) return std::unexpected(resolution.error());

    rewind(log);
    return MatchFeatures{
        .record_id = record.id,
        .interval = resolution->interval,
        .composite_score = resolution->chosen.composite_score,
        .disambiguated = resolution->disambiguated,
        .counters = extract_features(log, resolution->interval, record.primary_actor_id,
                                     index, config.extraction),
    };
}

std::expected<MatchFeatures, ResolveError> resolve_log_file(
    const std::filesystem::path& log_path, const MetadataRecord& record,
    const OwnershipIndex& index, const ResolverConfig& config,
    const TraceCallback& trace) {

    std::ifstream file(log_path);
    if (!file.is_open()) {
        return std::unexpected(ResolveError{
            ErrorKind::LogUnreadable, "cannot open " + log_path.string()});
    }
    return resolve_and_extract(file, record, index, config, trace);
}

} // namespace combatlog
