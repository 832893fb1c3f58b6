#pragma once

#include "combatlog/types.hpp"
#include <vector>

namespace combatlog {

// Pairs each start marker with the first end marker that follows it before the
// next start. Markers sharing a timestamp keep their scan order.
std::vector<Candidate> build_candidates(std::vector<SessionMarker> markers);

} // namespace combatlog
