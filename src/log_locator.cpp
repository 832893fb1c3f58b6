#include "combatlog/log_locator.hpp"
#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <regex>

namespace combatlog {

std::optional<TimePoint> log_start_from_filename(const std::string& filename) {
    static const std::regex pattern(R"((\d{2})(\d{2})(\d{2})_(\d{2})(\d{2})(\d{2}))");
    std::smatch m;
    if (!std::regex_search(filename, m, pattern)) return std::nullopt;

    std::tm tm{};
    tm.tm_mon = std::stoi(m[1]) - 1;
    tm.tm_mday = std::stoi(m[2]);
    tm.tm_year = 2000 + std::stoi(m[3]) - 1900;
    tm.tm_hour = std::stoi(m[4]);
    tm.tm_min = std::stoi(m[5]);
    tm.tm_sec = std::stoi(m[6]);
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31) return std::nullopt;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::vector<std::filesystem::path> list_log_files(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> logs;
    std::error_code ec;
    for (auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".txt") {
            logs.push_back(entry.path());
        }
    }
    std::ranges::sort(logs);
    return logs;
}

std::optional<std::filesystem::path> find_log_for_record(
    const std::vector<std::filesystem::path>& logs, TimePoint declared_start,
    std::chrono::seconds late_start) {

    std::optional<std::filesystem::path> best;
    std::chrono::seconds best_diff{0};

    for (auto& log : logs) {
        auto start = log_start_from_filename(log.filename().string());
        if (!start) continue;

        auto diff = std::chrono::duration_cast<std::chrono::seconds>(declared_start - *start);
        if (std::chrono::abs(diff) > std::chrono::hours(24)) continue;
        if (diff.count() <= 0 && -diff > late_start) continue;

        if (!best || std::chrono::abs(diff) < best_diff) {
            best = log;
            best_diff = std::chrono::abs(diff);
        }
    }

    return best;
}

} // namespace combatlog
