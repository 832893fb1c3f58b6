#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace combatlog {

// "Felhunter-1234" -> "Felhunter". Only a trailing all-digit suffix is removed.
std::string strip_volatile_suffix(std::string_view id);

// "Name-Realm-Region" -> "Name"
std::string short_name(std::string_view id);

// Full identities are compared when both sides carry a realm, short names otherwise.
bool same_actor(std::string_view a, std::string_view b);

// Sub-agent -> owning actor lookup. Built once, then shared read-only.
class OwnershipIndex {
public:
    void add(const std::string& sub_agent, const std::string& owner);

    std::optional<std::string> owner_of(std::string_view sub_agent) const;
    bool is_owned_by(std::string_view sub_agent, std::string_view owner) const;

    size_t size() const { return owners_.size(); }
    bool empty() const { return owners_.empty(); }

private:
    const std::vector<std::string>* find(std::string_view sub_agent) const;

    std::unordered_map<std::string, std::vector<std::string>> owners_;
};

} // namespace combatlog
