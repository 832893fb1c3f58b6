#pragma once

#include "combatlog/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace combatlog {

// Start time encoded in a combat log filename, e.g. WoWCombatLog-042025_190322.txt
std::optional<TimePoint> log_start_from_filename(const std::string& filename);

std::vector<std::filesystem::path> list_log_files(const std::filesystem::path& dir);

// Log whose start is nearest the declared start, within a day. A log may begin
// up to `late_start` after the match and still be considered.
std::optional<std::filesystem::path> find_log_for_record(
    const std::vector<std::filesystem::path>& logs, TimePoint declared_start,
    std::chrono::seconds late_start = std::chrono::seconds(600));

} // namespace combatlog
