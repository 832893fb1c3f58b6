#include "combatlog/batch.hpp"
#include "combatlog/env.hpp"
#include "combatlog/log_locator.hpp"
#include "combatlog/metadata_loader.hpp"
#include "combatlog/report.hpp"
#include "combatlog/resolved_ledger.hpp"
#include "combatlog/types.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace {

struct CliArgs {
    std::string metadata_path;
    std::string logs_dir;
    std::string index_path;
    int threads = 0;
    combatlog::OutputFormat format = combatlog::OutputFormat::Table;
    std::string ledger_path;
    std::string output_path;
    std::string env_path = ".env";
    bool verbose = false;
};

void print_usage() {
    std::cerr << R"(Usage: combatlog-resolve <metadata.json> <logs_dir> <ownership_index.json> [options]
  --threads <n>               Worker threads (default: hardware concurrency)
  --format <table|csv|json>   Output format (default: table)
  --ledger <path>             Resolved ledger; resolved records are skipped on rerun
  --output <path>             Write the report here instead of stdout
  --env <path>                Env file with COMBATLOG_* overrides (default: .env)
  --verbose                   Trace candidate scoring to stderr
)";
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 4) return std::nullopt;

    CliArgs args;
    args.metadata_path = argv[1];
    args.logs_dir = argv[2];
    args.index_path = argv[3];

    for (int i = 4; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[++i];

        if (flag == "--threads") {
            try {
                args.threads = std::stoi(val);
            } catch (const std::exception&) {
                std::cerr << "Invalid thread count: " << val << "\n";
                return std::nullopt;
            }
        }
        else if (flag == "--format") {
            if (val == "csv") args.format = combatlog::OutputFormat::Csv;
            else if (val == "json") args.format = combatlog::OutputFormat::Json;
            else args.format = combatlog::OutputFormat::Table;
        }
        else if (flag == "--ledger") args.ledger_path = val;
        else if (flag == "--output") args.output_path = val;
        else if (flag == "--env") args.env_path = val;
        else {
            std::cerr << "Unknown option: " << flag << "\n";
            return std::nullopt;
        }
    }

    if (args.threads <= 0) {
        args.threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }

    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    combatlog::load_env(args->env_path);
    combatlog::ResolverConfig config;
    combatlog::apply_env_overrides(config);

    // The ownership index must load before any record is attempted
    auto index = combatlog::load_ownership_index(args->index_path);
    if (!index) {
        std::cerr << "Error loading ownership index " << index.error().path << ": "
                  << index.error().message << "\n";
        return 1;
    }
    std::cerr << "Loaded ownership index with " << index->size() << " sub-agents\n";

    auto records = combatlog::load_metadata_file(args->metadata_path, config.log_utc_offset);
    if (!records) {
        std::cerr << "Error loading metadata " << records.error().path << ": "
                  << records.error().message << "\n";
        return 1;
    }
    if (records->empty()) {
        std::cerr << "No metadata records found.\n";
        return 0;
    }

    auto logs = combatlog::list_log_files(args->logs_dir);
    std::cerr << "Found " << logs.size() << " combat logs for "
              << records->size() << " records\n";

    std::vector<combatlog::BatchJob> jobs;
    for (auto& record : *records) {
        auto log = combatlog::find_log_for_record(logs, record.declared_start);
        jobs.push_back({record, log});
    }

    std::optional<combatlog::ResolvedLedger> ledger;
    if (!args->ledger_path.empty()) {
        ledger.emplace(args->ledger_path);
        if (ledger->load()) {
            std::cerr << "Ledger lists " << ledger->resolved_keys().size()
                      << " resolved records\n";
        }
    }

    combatlog::TraceCallback trace;
    if (args->verbose) {
        trace = [](const std::string& message) { std::cerr << message << "\n"; };
    }

    static const std::unordered_set<std::string> no_keys;
    auto report = combatlog::run_batch(
        jobs, *index, config, ledger ? ledger->resolved_keys() : no_keys,
        args->threads, combatlog::display_progress, trace);

    if (ledger) {
        for (auto& outcome : report.outcomes) {
            if (outcome.status == combatlog::OutcomeStatus::Resolved) {
                ledger->mark_resolved(outcome.key);
            } else if (outcome.error) {
                ledger->record_failure(outcome.key, combatlog::to_string(outcome.error->kind) +
                                                        ": " + outcome.error->message);
            }
        }
        if (!ledger->save()) {
            std::cerr << "Warning: could not write ledger " << args->ledger_path << "\n";
        }
    }

    if (!args->output_path.empty()) {
        std::ofstream out(args->output_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot write " << args->output_path << "\n";
            return 1;
        }
        combatlog::display_report(report, args->format, out);
    } else {
        combatlog::display_report(report, args->format, std::cout);
    }

    std::cerr << "Resolved " << report.resolved << "/" << (report.resolved + report.unresolved)
              << " records (" << report.skipped << " skipped)\n";
    return 0;
}
