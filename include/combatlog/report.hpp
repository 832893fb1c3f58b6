#pragma once

#include "combatlog/batch.hpp"
#include "combatlog/types.hpp"
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace combatlog {

enum class OutputFormat {
    Table,
    Csv,
    Json,
};

std::string format_time(TimePoint t);

nlohmann::json features_to_json(const MatchFeatures& features);
nlohmann::json report_to_json(const BatchReport& report);

void write_features_csv(const BatchReport& report, std::ostream& out);

// Per-record status table plus the resolved/unresolved ratio.
std::string render_batch_summary(const BatchReport& report);

void display_report(const BatchReport& report, OutputFormat format, std::ostream& out);

void display_progress(int current, int total);

} // namespace combatlog
