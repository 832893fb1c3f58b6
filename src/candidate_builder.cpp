#include "combatlog/candidate_builder.hpp"
#include <algorithm>

namespace combatlog {

std::vector<Candidate> build_candidates(std::vector<SessionMarker> markers) {
    if (markers.empty()) return {};

    std::ranges::stable_sort(markers, {}, &SessionMarker::timestamp);

    std::vector<Candidate> candidates;
    int scan_index = 0;

    for (size_t i = 0; i < markers.size(); ++i) {
        if (markers[i].boundary != Boundary::Start) continue;

        Candidate c;
        c.start = markers[i];
        c.scan_index = scan_index++;

        for (size_t j = i + 1; j < markers.size(); ++j) {
            if (markers[j].boundary == Boundary::Start) break;
            if (markers[j].timestamp > c.start.timestamp) {
                c.end = markers[j];
                c.duration = std::chrono::duration_cast<std::chrono::seconds>(
                    markers[j].timestamp - c.start.timestamp);
                break;
            }
        }

        candidates.push_back(std::move(c));
    }

    return candidates;
}

} // namespace combatlog
