#pragma once

#include <string>

namespace combatlog {

// Arena name for a numeric zone id, or "Zone_<id>" when unknown.
std::string zone_name(int zone_id);

} // namespace combatlog
