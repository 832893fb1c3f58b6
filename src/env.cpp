#include "combatlog/env.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace combatlog {

namespace {

std::string trim(std::string_view sv) {
    auto start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = sv.find_last_not_of(" \t\r\n");
    return std::string(sv.substr(start, end - start + 1));
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 &&
        ((s.front() == '"' && s.back() == '"') ||
         (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> items;
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ';')) {
        auto t = trim(item);
        if (!t.empty()) items.push_back(t);
    }
    return items;
}

void override_double(const char* key, double& target) {
    if (auto v = get_env_double(key)) target = *v;
}

template <typename Duration>
void override_duration(const char* key, Duration& target) {
    if (auto v = get_env_int(key)) target = Duration(*v);
}

} // namespace

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path) {

    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    std::string line;
    while (std::getline(file, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) continue;

        auto key = trim(trimmed.substr(0, eq));
        auto val = strip_quotes(trim(trimmed.substr(eq + 1)));

        if (!key.empty()) {
            vars[key] = val;
            ::setenv(key.c_str(), val.c_str(), 0); // don't overwrite existing
        }
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    if (auto* val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<int> get_env_int(const std::string& key) {
    auto val = get_env(key);
    if (!val) return std::nullopt;
    try {
        size_t pos = 0;
        int n = std::stoi(*val, &pos);
        if (pos != val->size()) return std::nullopt;
        return n;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> get_env_double(const std::string& key) {
    auto val = get_env(key);
    if (!val) return std::nullopt;
    try {
        size_t pos = 0;
        double d = std::stod(*val, &pos);
        if (pos != val->size()) return std::nullopt;
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void apply_env_overrides(ResolverConfig& config) {
    auto& s = config.scoring;
    override_double("COMBATLOG_CATEGORY_WEIGHT", s.category_weight);
    override_double("COMBATLOG_LOCATION_WEIGHT", s.location_name_weight);
    override_double("COMBATLOG_ZONE_ID_WEIGHT", s.zone_id_weight);
    override_double("COMBATLOG_PROXIMITY_WEIGHT", s.proximity_weight);
    override_double("COMBATLOG_DURATION_BONUS", s.duration_bonus);
    override_double("COMBATLOG_HIGH_CONFIDENCE", s.high_confidence);
    override_double("COMBATLOG_COMPETITIVE_MARGIN", s.competitive_margin);
    override_double("COMBATLOG_MIN_VIABLE", s.min_viable);
    override_double("COMBATLOG_DURATION_RANK_WEIGHT", s.duration_rank_weight);
    override_double("COMBATLOG_CROSS_SOURCE_RANK_WEIGHT", s.cross_source_rank_weight);

    if (auto v = get_env_int("COMBATLOG_MAX_OFFSET_MIN")) s.max_offset = std::chrono::minutes(*v);
    override_duration("COMBATLOG_DURATION_TOLERANCE_S", s.duration_tolerance);
    override_duration("COMBATLOG_DURATION_TIE_BAND_S", s.duration_tie_band);
    override_duration("COMBATLOG_SEARCH_PADDING_S", config.search_padding);
    override_duration("COMBATLOG_ELIMINATION_TOLERANCE_S", config.elimination_tolerance);
    override_duration("COMBATLOG_LOG_UTC_OFFSET_MIN", config.log_utc_offset);

    if (auto v = get_env("COMBATLOG_DISPEL_SPELLS")) {
        config.extraction.dispel_spells = split_list(*v);
    }
    if (auto v = get_env("COMBATLOG_TRACKED_BUFF")) config.extraction.tracked_buff = *v;
    if (auto v = get_env("COMBATLOG_CONTINUOUS_CATEGORIES")) {
        config.continuous_categories = split_list(*v);
    }
}

} // namespace combatlog
