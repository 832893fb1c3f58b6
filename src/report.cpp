#include "combatlog/report.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace combatlog {

namespace {

using namespace ftxui;

std::string f2(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string fpct(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (v * 100.0) << "%";
    return oss.str();
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

std::string status_label(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Resolved: return "resolved";
        case OutcomeStatus::Unresolved: return "unresolved";
        case OutcomeStatus::Skipped: return "skipped";
    }
    return "unknown";
}

Color status_color(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Resolved: return Color::Green;
        case OutcomeStatus::Unresolved: return Color::Red;
        case OutcomeStatus::Skipped: return Color::GrayDark;
    }
    return Color::White;
}

} // namespace

std::string format_time(TimePoint t) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(t);
    auto millis = std::chrono::duration_cast<Millis>(t - secs).count();
    auto tt = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

nlohmann::json features_to_json(const MatchFeatures& features) {
    nlohmann::json j;
    j["record_id"] = features.record_id;
    j["interval_start"] = format_time(features.interval.begin);
    j["interval_end"] = format_time(features.interval.end);
    j["composite_score"] = features.composite_score;
    j["disambiguated"] = features.disambiguated;
    for (auto& [name, value] : features.counters.counters()) {
        j[name] = value;
    }
    j["spells_cast"] = features.counters.spells_cast;
    j["spells_purged"] = features.counters.spells_purged;
    return j;
}

nlohmann::json report_to_json(const BatchReport& report) {
    nlohmann::json records = nlohmann::json::array();
    for (auto& o : report.outcomes) {
        nlohmann::json r;
        r["record_id"] = o.record_id;
        r["key"] = o.key;
        r["status"] = status_label(o.status);
        if (o.log_path) r["log"] = o.log_path->string();
        if (o.features) r["features"] = features_to_json(*o.features);
        if (o.error) {
            r["error"] = to_string(o.error->kind);
            r["reason"] = o.error->message;
        }
        records.push_back(std::move(r));
    }

    nlohmann::json failures = nlohmann::json::object();
    for (auto& [kind, count] : report.failures_by_kind) failures[to_string(kind)] = count;

    return {
        {"resolved", report.resolved},
        {"unresolved", report.unresolved},
        {"skipped", report.skipped},
        {"resolved_ratio", report.resolved_ratio()},
        {"failures_by_kind", failures},
        {"records", records},
    };
}

void write_features_csv(const BatchReport& report, std::ostream& out) {
    FeatureCounters header_source;
    out << "record_id,interval_start,interval_end,composite_score,disambiguated";
    for (auto& [name, _] : header_source.counters()) out << ',' << name;
    out << ",spells_cast,spells_purged\n";

    for (auto& o : report.outcomes) {
        if (!o.features) continue;
        auto& f = *o.features;
        out << csv_escape(f.record_id) << ','
            << format_time(f.interval.begin) << ','
            << format_time(f.interval.end) << ','
            << f2(f.composite_score) << ','
            << (f.disambiguated ? "true" : "false");
        for (auto& [_, value] : f.counters.counters()) out << ',' << value;
        out << ',' << csv_escape(join(f.counters.spells_cast, "; "))
            << ',' << csv_escape(join(f.counters.spells_purged, "; ")) << '\n';
    }
}

std::string render_batch_summary(const BatchReport& report) {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Record", "Status", "Interval", "Score", "Casts", "Interrupts", "Purges", "Reason"});

    for (auto& o : report.outcomes) {
        std::vector<std::string> row = {o.record_id, status_label(o.status)};
        if (o.features) {
            auto& f = *o.features;
            row.push_back(format_time(f.interval.begin) + " - " + format_time(f.interval.end));
            row.push_back(f2(f.composite_score) + (f.disambiguated ? "*" : ""));
            row.push_back(std::to_string(f.counters.casts));
            row.push_back(std::to_string(f.counters.interrupts_performed));
            row.push_back(std::to_string(f.counters.purges));
            row.push_back("");
        } else {
            row.insert(row.end(), {"-", "-", "-", "-", "-"});
            row.push_back(o.error ? to_string(o.error->kind) : "");
        }
        rows.push_back(std::move(row));
    }

    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectAll().Border(LIGHT);
    for (size_t i = 1; i < rows.size(); ++i) {
        table.SelectCell(1, static_cast<int>(i))
            .Decorate(color(status_color(report.outcomes[i - 1].status)));
    }

    Elements failure_lines;
    for (auto& [kind, count] : report.failures_by_kind) {
        failure_lines.push_back(text("  " + to_string(kind) + ": " + std::to_string(count)) |
                                color(Color::Red));
    }

    auto document = vbox({
        text("Session Resolution") | bold | color(Color::Cyan),
        separator(),
        table.Render(),
        text(""),
        hbox({
            text("Resolved ") | bold,
            text(std::to_string(report.resolved)) | color(Color::Green),
            text("  Unresolved ") | bold,
            text(std::to_string(report.unresolved)) | color(Color::Red),
            text("  Skipped ") | bold,
            text(std::to_string(report.skipped)) | dim,
            text("  Ratio ") | bold,
            text(fpct(report.resolved_ratio())),
        }),
        vbox(failure_lines),
    });

    // Screen sized to the document rather than the terminal
    document->ComputeRequirement();
    auto req = document->requirement();
    auto screen = Screen::Create(Dimension::Fixed(req.min_x), Dimension::Fixed(req.min_y));
    Render(screen, document);
    return screen.ToString();
}

void display_report(const BatchReport& report, OutputFormat format, std::ostream& out) {
    switch (format) {
        case OutputFormat::Table:
            out << render_batch_summary(report) << "\n";
            break;
        case OutputFormat::Csv:
            write_features_csv(report, out);
            break;
        case OutputFormat::Json:
            out << report_to_json(report).dump(2) << "\n";
            break;
    }
}

void display_progress(int current, int total) {
    std::cerr << "\rResolved " << current << "/" << total << " records" << std::flush;
    if (current == total) std::cerr << "\n";
}

} // namespace combatlog
