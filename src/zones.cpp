#include "combatlog/zones.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace combatlog {

namespace {

constexpr std::array<std::pair<int, const char*>, 15> kArenaZones = {{
    {572, "Ruins of Lordaeron"},
    {617, "Dalaran Sewers"},
    {980, "Tol'viron"},
    {1134, "Tiger's Peak"},
    {1504, "Black Rook"},
    {1505, "Nagrand"},
    {1552, "Ashamane's Fall"},
    {1825, "Hook Point"},
    {1911, "Mugambala"},
    {2167, "Robodrome"},
    {2373, "Empyrean Domain"},
    {2509, "Maldraxxus"},
    {2547, "Enigma Crucible"},
    {2563, "Nokhudon"},
    {2759, "Cage of Carnage"},
}};

} // namespace

std::string zone_name(int zone_id) {
    auto it = std::ranges::find(kArenaZones, zone_id, &std::pair<int, const char*>::first);
    if (it != kArenaZones.end()) return it->second;
    return "Zone_" + std::to_string(zone_id);
}

} // namespace combatlog
