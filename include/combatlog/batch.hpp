#pragma once

#include "combatlog/ownership_index.hpp"
#include "combatlog/types.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace combatlog {

struct BatchJob {
    MetadataRecord record;
    std::optional<std::filesystem::path> log_path;
};

enum class OutcomeStatus {
    Resolved,
    Unresolved,
    Skipped,
};

struct RecordOutcome {
    std::string record_id;
    std::string key;
    std::optional<std::filesystem::path> log_path;
    OutcomeStatus status = OutcomeStatus::Unresolved;
    std::optional<MatchFeatures> features;
    std::optional<ResolveError> error;
};

struct BatchReport {
    std::vector<RecordOutcome> outcomes; // job order
    int resolved = 0;
    int unresolved = 0;
    int skipped = 0;
    std::map<ErrorKind, int> failures_by_kind;

    double resolved_ratio() const {
        int attempted = resolved + unresolved;
        return attempted == 0 ? 0.0 : static_cast<double>(resolved) / attempted;
    }
};

// "<log filename>_<record id>"
std::string ledger_key(const BatchJob& job);

// Resolves every job on a pool of workers. Jobs whose key is in
// `already_resolved` are skipped; failures never stop the batch.
BatchReport run_batch(const std::vector<BatchJob>& jobs, const OwnershipIndex& index,
                      const ResolverConfig& config,
                      const std::unordered_set<std::string>& already_resolved,
                      int threads = 1, ProgressCallback on_progress = nullptr,
                      TraceCallback trace = nullptr);

} // namespace combatlog
