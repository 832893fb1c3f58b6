#pragma once

#include "combatlog/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace combatlog {

bool category_matches(const std::string& log_category, const std::string& declared,
                      const std::vector<CategoryRule>& rules);

bool location_name_matches(const std::string& log_location, const std::string& declared);

Candidate score_candidate(Candidate candidate, const MetadataRecord& record,
                          const ScoringConfig& config);

std::vector<Candidate> score_candidates(std::vector<Candidate> candidates,
                                        const MetadataRecord& record,
                                        const ScoringConfig& config);

// Index of the single candidate at or above the high-confidence threshold with
// no rival inside the competitive margin.
std::optional<size_t> confident_winner(const std::vector<Candidate>& candidates,
                                       const ScoringConfig& config);

// Candidates still in contention when no confident winner exists.
std::vector<size_t> competitive_set(const std::vector<Candidate>& candidates,
                                    const ScoringConfig& config);

} // namespace combatlog
