#include "combatlog/open_session.hpp"
#include <algorithm>
#include <utility>

namespace combatlog {

bool is_continuous_category(const std::string& category, const ResolverConfig& config) {
    return std::ranges::find(config.continuous_categories, category) !=
           config.continuous_categories.end();
}

void synthesize_open_end(Candidate& candidate, std::chrono::seconds declared_duration) {
    if (declared_duration <= std::chrono::seconds(0)) {
        candidate.excluded = true;
        candidate.exclusion_reason = "open-ended without declared duration";
        return;
    }

    SessionMarker end;
    end.timestamp = candidate.start.timestamp + declared_duration;
    end.boundary = Boundary::End;
    end.session_type = candidate.start.session_type;
    end.location_id = candidate.start.location_id;
    end.location_name = candidate.start.location_name;
    end.declared_category = candidate.start.declared_category;

    candidate.end = std::move(end);
    candidate.end_synthetic = true;
    candidate.duration = declared_duration;
}

} // namespace combatlog
