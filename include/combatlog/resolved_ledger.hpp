#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace combatlog {

// Persisted record of which (log, record) pairs were already resolved and why
// the others failed. The batch driver only sees the key set it is handed.
class ResolvedLedger {
public:
    explicit ResolvedLedger(std::filesystem::path path = "resolved_ledger.json");

    bool load();
    bool save() const;

    bool contains(const std::string& key) const { return resolved_.contains(key); }
    const std::unordered_set<std::string>& resolved_keys() const { return resolved_; }
    const std::map<std::string, std::string>& failures() const { return failures_; }

    void mark_resolved(const std::string& key);
    void record_failure(const std::string& key, const std::string& reason);

private:
    std::filesystem::path path_;
    std::unordered_set<std::string> resolved_;
    std::map<std::string, std::string> failures_;
};

} // namespace combatlog
