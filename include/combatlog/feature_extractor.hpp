#pragma once

#include "combatlog/ownership_index.hpp"
#include "combatlog/types.hpp"
#include <istream>
#include <string>

namespace combatlog {

// Applies the per-category attribution rules to one parsed event.
void apply_event(const Event& event, const std::string& primary_actor,
                 const OwnershipIndex& index, const ExtractionRules& rules,
                 FeatureCounters& counters);

// Second pass over the log. Every event with a timestamp in the closed
// interval is parsed and classified; the stream is read forward once.
FeatureCounters extract_features(std::istream& log, const Interval& interval,
                                 const std::string& primary_actor,
                                 const OwnershipIndex& index,
                                 const ExtractionRules& rules = {});

} // namespace combatlog
