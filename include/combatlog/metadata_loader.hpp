#pragma once

#include "combatlog/ownership_index.hpp"
#include "combatlog/types.hpp"
#include <expected>
#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>

namespace combatlog {

// Accepts both the canonical keys and the recorder's own JSON layout
// (start in epoch ms, zoneID/zoneName, player._name, deaths[]).
MetadataRecord parse_metadata(const nlohmann::json& j,
                              std::chrono::minutes log_utc_offset = std::chrono::minutes(0));

std::expected<std::vector<MetadataRecord>, InputError> load_metadata_file(
    const std::filesystem::path& path,
    std::chrono::minutes log_utc_offset = std::chrono::minutes(0));

OwnershipIndex parse_ownership_index(const nlohmann::json& j);

std::expected<OwnershipIndex, InputError> load_ownership_index(
    const std::filesystem::path& path);

} // namespace combatlog
