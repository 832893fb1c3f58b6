#pragma once

#include "combatlog/types.hpp"
#include <chrono>
#include <string>

namespace combatlog {

// Categories whose rounds run back to back without an end marker.
bool is_continuous_category(const std::string& category, const ResolverConfig& config);

// Replaces end-pairing: end = start + declared_duration. A non-positive
// duration leaves the candidate open and excluded.
void synthesize_open_end(Candidate& candidate, std::chrono::seconds declared_duration);

} // namespace combatlog
