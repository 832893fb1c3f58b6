#pragma once

#include "combatlog/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace combatlog {

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);
std::optional<int> get_env_int(const std::string& key);
std::optional<double> get_env_double(const std::string& key);

// COMBATLOG_* variables override the compiled-in tuning defaults.
void apply_env_overrides(ResolverConfig& config);

} // namespace combatlog
