#include "combatlog/ownership_index.hpp"
#include <algorithm>
#include <cctype>

namespace combatlog {

std::string strip_volatile_suffix(std::string_view id) {
    auto dash = id.rfind('-');
    if (dash == std::string_view::npos || dash + 1 == id.size()) return std::string(id);

    auto suffix = id.substr(dash + 1);
    bool all_digits = std::ranges::all_of(
        suffix, [](unsigned char c) { return std::isdigit(c) != 0; });
    return std::string(all_digits ? id.substr(0, dash) : id);
}

std::string short_name(std::string_view id) {
    return std::string(id.substr(0, id.find('-')));
}

bool same_actor(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return false;
    bool a_full = a.find('-') != std::string_view::npos;
    bool b_full = b.find('-') != std::string_view::npos;
    if (a_full && b_full) return a == b;
    return short_name(a) == short_name(b);
}

void OwnershipIndex::add(const std::string& sub_agent, const std::string& owner) {
    auto& owners = owners_[strip_volatile_suffix(sub_agent)];
    if (std::ranges::find(owners, owner) == owners.end()) {
        owners.push_back(owner);
    }
}

const std::vector<std::string>* OwnershipIndex::find(std::string_view sub_agent) const {
    if (sub_agent.empty()) return nullptr;

    if (auto it = owners_.find(std::string(sub_agent)); it != owners_.end())
        return &it->second;
    if (auto it = owners_.find(strip_volatile_suffix(sub_agent)); it != owners_.end())
        return &it->second;
    if (auto it = owners_.find(short_name(sub_agent)); it != owners_.end())
        return &it->second;
    return nullptr;
}

std::optional<std::string> OwnershipIndex::owner_of(std::string_view sub_agent) const {
    auto* owners = find(sub_agent);
    if (!owners || owners->empty()) return std::nullopt;
    return owners->front();
}

bool OwnershipIndex::is_owned_by(std::string_view sub_agent, std::string_view owner) const {
    auto* owners = find(sub_agent);
    if (!owners) return false;
    return std::ranges::any_of(*owners, [&](const std::string& o) { return same_actor(o, owner); });
}

} // namespace combatlog
