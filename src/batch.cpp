#include "combatlog/batch.hpp"
#include "combatlog/resolver.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <utility>

namespace combatlog {

namespace {

RecordOutcome resolve_job(const BatchJob& job, const OwnershipIndex& index,
                          const ResolverConfig& config,
                          const std::unordered_set<std::string>& already_resolved,
                          const TraceCallback& trace) {
    RecordOutcome outcome;
    outcome.record_id = job.record.id;
    outcome.key = ledger_key(job);
    outcome.log_path = job.log_path;

    if (already_resolved.contains(outcome.key)) {
        outcome.status = OutcomeStatus::Skipped;
        return outcome;
    }

    if (!job.log_path) {
        outcome.error = ResolveError{ErrorKind::LogUnreadable,
                                     "no combat log covers " + job.record.id};
        return outcome;
    }

    auto result = resolve_log_file(*job.log_path, job.record, index, config, trace);
    if (result) {
        outcome.status = OutcomeStatus::Resolved;
        outcome.features = std::move(*result);
    } else {
        outcome.error = result.error();
    }
    return outcome;
}

} // namespace

std::string ledger_key(const BatchJob& job) {
    if (!job.log_path) return job.record.id;
    return job.log_path->filename().string() + "_" + job.record.id;
}

BatchReport run_batch(const std::vector<BatchJob>& jobs, const OwnershipIndex& index,
                      const ResolverConfig& config,
                      const std::unordered_set<std::string>& already_resolved,
                      int threads, ProgressCallback on_progress, TraceCallback trace) {
    BatchReport report;
    report.outcomes.resize(jobs.size());

    std::mutex callback_mutex;
    TraceCallback locked_trace;
    if (trace) {
        locked_trace = [&](const std::string& message) {
            std::lock_guard lock(callback_mutex);
            trace(message);
        };
    }

    std::atomic<size_t> next{0};
    std::atomic<int> done{0};
    int total = static_cast<int>(jobs.size());

    auto worker = [&] {
        for (size_t i = next++; i < jobs.size(); i = next++) {
            report.outcomes[i] = resolve_job(jobs[i], index, config, already_resolved, locked_trace);
            int finished = ++done;
            if (on_progress) {
                std::lock_guard lock(callback_mutex);
                on_progress(finished, total);
            }
        }
    };

    int pool_size = std::clamp(threads, 1, std::max(1, total));
    std::vector<std::thread> pool;
    for (int t = 1; t < pool_size; ++t) pool.emplace_back(worker);
    worker();
    for (auto& th : pool) th.join();

    for (auto& outcome : report.outcomes) {
        switch (outcome.status) {
            case OutcomeStatus::Resolved: report.resolved++; break;
            case OutcomeStatus::Skipped: report.skipped++; break;
            case OutcomeStatus::Unresolved:
                report.unresolved++;
                if (outcome.error) report.failures_by_kind[outcome.error->kind]++;
                break;
        }
    }

    return report;
}

} // namespace combatlog
