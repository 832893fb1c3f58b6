#include "combatlog/metadata_loader.hpp"
#include "combatlog/zones.hpp"
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <initializer_list>

namespace combatlog {

namespace {

TimePoint parse_epoch_ms(std::int64_t epoch_ms) {
    return TimePoint(Millis(epoch_ms));
}

TimePoint parse_iso8601(const std::string& s) {
    std::tm tm{};
    sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d",
           &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
           &tm.tm_hour, &tm.tm_min, &tm.tm_sec);
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

int safe_int(const nlohmann::json& j, const std::string& key, int fallback = 0) {
    if (j.contains(key) && !j[key].is_null() && j[key].is_number())
        return static_cast<int>(std::lround(j[key].get<double>()));
    return fallback;
}

double safe_double(const nlohmann::json& j, const std::string& key, double fallback = 0.0) {
    if (j.contains(key) && !j[key].is_null() && j[key].is_number())
        return j[key].get<double>();
    return fallback;
}

std::string safe_str(const nlohmann::json& j, const std::string& key,
                     const std::string& fallback = "") {
    if (j.contains(key) && !j[key].is_null() && j[key].is_string())
        return j[key].get<std::string>();
    return fallback;
}

// First present key wins
std::string first_str(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (auto* key : keys) {
        auto v = safe_str(j, key);
        if (!v.empty()) return v;
    }
    return "";
}

Reliability parse_reliability(const std::string& s) {
    if (s == "high") return Reliability::High;
    if (s == "low") return Reliability::Low;
    return Reliability::Medium;
}

std::vector<GroundTruthEvent> parse_ground_truth(const nlohmann::json& j) {
    std::vector<GroundTruthEvent> events;

    if (j.contains("ground_truth") && j["ground_truth"].is_array()) {
        for (auto& e : j["ground_truth"]) {
            events.push_back({safe_str(e, "actor"), safe_double(e, "offset")});
        }
    } else if (j.contains("deaths") && j["deaths"].is_array()) {
        for (auto& e : j["deaths"]) {
            if (!e.contains("name") || !e.contains("timestamp")) continue;
            events.push_back({safe_str(e, "name"), safe_double(e, "timestamp")});
        }
    }
    return events;
}

std::expected<nlohmann::json, InputError> read_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::unexpected(InputError{path.string(), "cannot open file"});

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(InputError{path.string(), std::string("JSON parse error: ") + e.what()});
    }
}

} // namespace

MetadataRecord parse_metadata(const nlohmann::json& j, std::chrono::minutes log_utc_offset) {
    MetadataRecord r;
    r.id = first_str(j, {"id", "filename"});

    if (j.contains("declared_start") && j["declared_start"].is_string()) {
        r.declared_start = parse_iso8601(j["declared_start"].get<std::string>());
    } else if (j.contains("start") && j["start"].is_number()) {
        // Epoch instants are shifted onto the log's wall clock
        r.declared_start = parse_epoch_ms(j["start"].get<std::int64_t>()) + log_utc_offset;
    }

    r.declared_duration = std::chrono::seconds(
        safe_int(j, "declared_duration", safe_int(j, "duration")));
    r.declared_category = first_str(j, {"category", "bracket"});
    r.declared_location = first_str(j, {"location", "zoneName"});

    if (j.contains("zone_id") && j["zone_id"].is_number()) {
        r.zone_id = j["zone_id"].get<int>();
    } else if (j.contains("zoneID") && j["zoneID"].is_number()) {
        r.zone_id = j["zoneID"].get<int>();
    }
    if (r.declared_location.empty() && r.zone_id) r.declared_location = zone_name(*r.zone_id);

    r.primary_actor_id = safe_str(j, "primary_actor");
    if (r.primary_actor_id.empty() && j.contains("player") && j["player"].is_object()) {
        r.primary_actor_id = safe_str(j["player"], "_name");
    }

    r.reliability = parse_reliability(safe_str(j, "reliability", "medium"));
    r.ground_truth_events = parse_ground_truth(j);
    return r;
}

std::expected<std::vector<MetadataRecord>, InputError> load_metadata_file(
    const std::filesystem::path& path, std::chrono::minutes log_utc_offset) {

    auto data = read_json(path);
    if (!data) return std::unexpected(data.error());

    const nlohmann::json* list = &*data;
    if (data->is_object() && data->contains("records")) list = &(*data)["records"];
    if (!list->is_array()) {
        return std::unexpected(InputError{path.string(), "expected an array of metadata records"});
    }

    std::vector<MetadataRecord> records;
    for (auto& j : *list) {
        if (!j.is_object()) continue;
        records.push_back(parse_metadata(j, log_utc_offset));
    }
    return records;
}

OwnershipIndex parse_ownership_index(const nlohmann::json& j) {
    OwnershipIndex index;

    if (j.contains("pet_lookup") && j["pet_lookup"].is_object()) {
        for (auto& [pet, owners] : j["pet_lookup"].items()) {
            if (owners.is_string()) {
                index.add(pet, owners.get<std::string>());
            } else if (owners.is_array()) {
                for (auto& owner : owners) {
                    if (owner.is_string()) index.add(pet, owner.get<std::string>());
                }
            }
        }
    }

    if (j.contains("player_pets") && j["player_pets"].is_object()) {
        for (auto& [owner, entry] : j["player_pets"].items()) {
            if (!entry.contains("pet_names") || !entry["pet_names"].is_array()) continue;
            for (auto& pet : entry["pet_names"]) {
                if (pet.is_string()) index.add(pet.get<std::string>(), owner);
            }
        }
    }

    return index;
}

std::expected<OwnershipIndex, InputError> load_ownership_index(
    const std::filesystem::path& path) {

    auto data = read_json(path);
    if (!data) return std::unexpected(data.error());
    if (!data->is_object()) {
        return std::unexpected(InputError{path.string(), "expected an ownership index object"});
    }
    return parse_ownership_index(*data);
}

} // namespace combatlog
