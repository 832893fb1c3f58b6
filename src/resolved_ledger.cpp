#include "combatlog/resolved_ledger.hpp"
#include <algorithm>
#include <fstream>
#include <utility>
#include <vector>

namespace combatlog {

ResolvedLedger::ResolvedLedger(std::filesystem::path path) : path_(std::move(path)) {}

bool ResolvedLedger::load() {
    if (!std::filesystem::exists(path_)) return false;

    std::ifstream file(path_);
    if (!file.is_open()) return false;

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception&) {
        return false;
    }

    if (data.contains("resolved") && data["resolved"].is_array()) {
        for (auto& key : data["resolved"]) {
            if (key.is_string()) resolved_.insert(key.get<std::string>());
        }
    }
    if (data.contains("failures") && data["failures"].is_object()) {
        for (auto& [key, reason] : data["failures"].items()) {
            if (reason.is_string()) failures_[key] = reason.get<std::string>();
        }
    }
    return true;
}

bool ResolvedLedger::save() const {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::vector<std::string> keys(resolved_.begin(), resolved_.end());
    std::ranges::sort(keys);

    nlohmann::json data;
    data["resolved"] = keys;
    data["failures"] = failures_;

    std::ofstream file(path_);
    if (!file.is_open()) return false;
    file << data.dump(2);
    return static_cast<bool>(file);
}

void ResolvedLedger::mark_resolved(const std::string& key) {
    resolved_.insert(key);
    failures_.erase(key);
}

void ResolvedLedger::record_failure(const std::string& key, const std::string& reason) {
    failures_[key] = reason;
}

} // namespace combatlog
