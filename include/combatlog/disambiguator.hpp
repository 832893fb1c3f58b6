#pragma once

#include "combatlog/types.hpp"
#include <chrono>
#include <expected>
#include <istream>
#include <vector>

namespace combatlog {

// Actor-eliminated events inside the closed interval, in log order.
std::vector<Event> collect_eliminations(std::istream& log, const Interval& interval);

// Fraction of ground-truth events that find an elimination of the same actor
// within +/- tolerance of candidate_start + offset. Each log event is matched once.
double cross_source_score(const std::vector<Event>& eliminations, TimePoint candidate_start,
                          const std::vector<GroundTruthEvent>& ground_truth,
                          std::chrono::seconds tolerance);

// Re-ranks the competitive candidates and returns the winner's index into
// `candidates`. The log stream is rewound for every interval it re-scans.
std::expected<size_t, ResolveError> disambiguate(
    std::istream& log, std::vector<Candidate>& candidates,
    const std::vector<size_t>& competitive, const MetadataRecord& record,
    const ResolverConfig& config, const TraceCallback& trace = nullptr);

} // namespace combatlog
