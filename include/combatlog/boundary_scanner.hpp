#pragma once

#include "combatlog/types.hpp"
#include <istream>
#include <vector>

namespace combatlog {

// Window searched for session markers: the record's nominal span, widened by
// the reliability buffer and the configured padding on both sides.
TimeWindow search_window(const MetadataRecord& record, const ResolverConfig& config);

// Single pass over the log. Only lines inside the window that carry a
// session boundary are split into fields. Markers are returned in file order.
std::vector<SessionMarker> scan_boundaries(
    std::istream& log, const TimeWindow& window, const ResolverConfig& config,
    ScanStats* stats = nullptr);

} // namespace combatlog
