#include "combatlog/disambiguator.hpp"
#include "combatlog/ownership_index.hpp"
#include "combatlog/tokenizer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace combatlog {

namespace {

constexpr double kEpsilon = 1e-6;

void rewind(std::istream& log) {
    log.clear();
    log.seekg(0);
}

bool all_equal(const std::vector<double>& values) {
    if (values.empty()) return true;
    auto [lo, hi] = std::ranges::minmax_element(values);
    return *hi - *lo <= kEpsilon;
}

std::string f2(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

} // namespace

std::vector<Event> collect_eliminations(std::istream& log, const Interval& interval) {
    std::vector<Event> eliminations;
    std::string line;

    while (std::getline(log, line)) {
        auto ts = peek_timestamp(line);
        if (!ts || !interval.contains(*ts)) continue;
        if (peek_event_kind(line) != EventKind::ActorEliminated) continue;

        auto event = tokenize_line(line);
        if (event) eliminations.push_back(std::move(*event));
    }

    return eliminations;
}

double cross_source_score(const std::vector<Event>& eliminations, TimePoint candidate_start,
                          const std::vector<GroundTruthEvent>& ground_truth,
                          std::chrono::seconds tolerance) {
    if (ground_truth.empty()) return 0.0;

    std::vector<bool> used(eliminations.size(), false);
    double tol = static_cast<double>(tolerance.count());
    int matched = 0;

    for (auto& truth : ground_truth) {
        auto expected = candidate_start + std::chrono::duration_cast<Millis>(
                                              std::chrono::duration<double>(truth.timestamp_offset));
        for (size_t i = 0; i < eliminations.size(); ++i) {
            if (used[i] || !same_actor(eliminations[i].target_id, truth.actor_id)) continue;
            double diff = std::abs(
                std::chrono::duration<double>(eliminations[i].timestamp - expected).count());
            if (diff <= tol) {
                used[i] = true;
                matched++;
                break;
            }
        }
    }

    return static_cast<double>(matched) / static_cast<double>(ground_truth.size());
}

std::expected<size_t, ResolveError> disambiguate(
    std::istream& log, std::vector<Candidate>& candidates,
    const std::vector<size_t>& competitive, const MetadataRecord& record,
    const ResolverConfig& config, const TraceCallback& trace) {

    if (competitive.empty()) {
        return std::unexpected(ResolveError{
            ErrorKind::NoConfidentMatch,
            "no candidate reached the viability bar of " + f2(config.scoring.min_viable)});
    }

    bool have_truth = !record.ground_truth_events.empty();
    bool have_duration = record.declared_duration.count() > 0;

    auto mismatch = [&](const Candidate& c) {
        return std::abs(static_cast<double>((c.duration - record.declared_duration).count()));
    };
    double best_mismatch = mismatch(candidates[competitive.front()]);
    double best_duration_score = 0.0;
    for (auto idx : competitive) {
        best_mismatch = std::min(best_mismatch, mismatch(candidates[idx]));
        best_duration_score = std::max(best_duration_score, candidates[idx].duration_score);
    }

    auto& scoring = config.scoring;
    double band = static_cast<double>(scoring.duration_tie_band.count());
    auto effective_duration = [&](const Candidate& c) {
        return mismatch(c) - best_mismatch <= band ? best_duration_score : c.duration_score;
    };

    std::vector<double> durations;
    std::vector<double> crosses;
    for (auto idx : competitive) {
        auto& c = candidates[idx];
        durations.push_back(effective_duration(c));

        if (have_truth) {
            rewind(log);
            auto eliminations = collect_eliminations(log, c.interval());
            c.elimination_count = static_cast<int>(eliminations.size());
            c.cross_source_score = cross_source_score(
                eliminations, c.start.timestamp, record.ground_truth_events,
                config.elimination_tolerance);
            crosses.push_back(c.cross_source_score);
        }
    }

    bool duration_discriminates = have_duration && !all_equal(durations);
    bool truth_discriminates = have_truth && !all_equal(crosses);
    bool by_proximity = !duration_discriminates && !truth_discriminates;

    auto rank_key = [&](const Candidate& c) {
        if (by_proximity) return c.proximity_score;
        if (have_duration && have_truth) {
            return scoring.duration_rank_weight * effective_duration(c) +
                   scoring.cross_source_rank_weight * c.cross_source_score;
        }
        return have_truth ? c.cross_source_score : effective_duration(c);
    };

    size_t best = competitive.front();
    for (auto idx : competitive) {
        auto& c = candidates[idx];
        auto& b = candidates[best];
        double key = rank_key(c);
        double best_key = rank_key(b);

        if (key > best_key + kEpsilon) {
            best = idx;
        } else if (std::abs(key - best_key) <= kEpsilon) {
            if (c.proximity_score > b.proximity_score + kEpsilon ||
                (std::abs(c.proximity_score - b.proximity_score) <= kEpsilon &&
                 c.scan_index < b.scan_index)) {
                best = idx;
            }
        }

        if (trace) {
            trace("  candidate #" + std::to_string(c.scan_index) +
                  " duration=" + f2(c.duration_score) +
                  " cross=" + f2(c.cross_source_score) +
                  " eliminations=" + std::to_string(c.elimination_count) +
                  " rank=" + f2(key));
        }
    }

    if (trace) {
        trace(std::string("  ranked by ") +
              (by_proximity ? "proximity" : "duration/cross-source") +
              ", winner #" + std::to_string(candidates[best].scan_index));
    }

    rewind(log);
    return best;
}

} // namespace combatlog
