#include "combatlog/scorer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace combatlog {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_placeholder(const std::string& lowered) {
    return lowered.empty() || lowered == "unknown" || lowered == "undefined";
}

double seconds_of(std::chrono::system_clock::duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

bool category_matches(const std::string& log_category, const std::string& declared,
                      const std::vector<CategoryRule>& rules) {
    auto declared_l = lower(declared);
    auto log_l = lower(log_category);

    for (auto& rule : rules) {
        if (lower(rule.declared) != declared_l) continue;
        return std::ranges::any_of(rule.accepted, [&](const std::string& accepted) {
            return lower(accepted) == log_l;
        });
    }
    return !declared_l.empty() && declared_l == log_l;
}

bool location_name_matches(const std::string& log_location, const std::string& declared) {
    auto a = lower(log_location);
    auto b = lower(declared);
    if (is_placeholder(a) || is_placeholder(b)) return false;
    return a == b || a.find(b) != std::string::npos || b.find(a) != std::string::npos;
}

Candidate score_candidate(Candidate c, const MetadataRecord& record,
                          const ScoringConfig& config) {
    c.attribute_score = 0.0;
    c.zone_id_score = 0.0;

    if (category_matches(c.start.declared_category, record.declared_category,
                         config.category_rules)) {
        c.attribute_score += config.category_weight;
    }

    if (record.zone_id) {
        if (*record.zone_id == c.start.location_id) c.zone_id_score = config.zone_id_weight;
    } else if (location_name_matches(c.start.location_name, record.declared_location)) {
        c.attribute_score += config.location_name_weight;
    }

    double offset = std::abs(seconds_of(c.start.timestamp - record.declared_start));
    double max_offset = static_cast<double>(config.max_offset.count());
    c.proximity_score = max_offset > 0.0 ? std::max(0.0, 1.0 - offset / max_offset) : 0.0;

    auto exclude = [&c](const char* reason) {
        c.excluded = true;
        c.exclusion_reason = reason;
    };
    if (c.excluded) {
        // reason already set by open-end synthesis
    } else if (!c.end) {
        exclude("open-ended");
    } else if (c.end->timestamp <= c.start.timestamp) {
        exclude("empty interval");
    } else if (offset > max_offset) {
        exclude("outside maximum offset");
    }

    double duration_bonus = 0.0;
    if (c.end) {
        auto diff = std::abs(static_cast<double>((c.duration - record.declared_duration).count()));
        double tolerance = static_cast<double>(config.duration_tolerance.count());
        c.duration_score = tolerance > 0.0 ? std::max(0.0, 1.0 - diff / tolerance) : 0.0;

        auto max_plausible = c.start.session_type == SessionType::ContinuousMultiRound
                                 ? config.max_plausible_continuous
                                 : config.max_plausible_duration;
        if (c.duration >= config.min_plausible_duration && c.duration <= max_plausible) {
            duration_bonus = config.duration_bonus;
        }
    }

    double composite = c.attribute_score + c.zone_id_score +
                       config.proximity_weight * c.proximity_score + duration_bonus;
    c.composite_score = std::min(composite, 1.0);
    return c;
}

std::vector<Candidate> score_candidates(std::vector<Candidate> candidates,
                                        const MetadataRecord& record,
                                        const ScoringConfig& config) {
    for (auto& c : candidates) {
        c = score_candidate(std::move(c), record, config);
    }
    return candidates;
}

std::optional<size_t> confident_winner(const std::vector<Candidate>& candidates,
                                       const ScoringConfig& config) {
    std::optional<size_t> best;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i].excluded) continue;
        if (!best || candidates[i].composite_score > candidates[*best].composite_score) best = i;
    }
    if (!best || candidates[*best].composite_score < config.high_confidence) return std::nullopt;

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (i == *best || candidates[i].excluded) continue;
        if (candidates[*best].composite_score - candidates[i].composite_score <
            config.competitive_margin) {
            return std::nullopt;
        }
    }
    return best;
}

std::vector<size_t> competitive_set(const std::vector<Candidate>& candidates,
                                    const ScoringConfig& config) {
    double best = -1.0;
    for (auto& c : candidates) {
        if (!c.excluded && c.composite_score >= config.min_viable)
            best = std::max(best, c.composite_score);
    }
    if (best < 0.0) return {};

    std::vector<size_t> result;
    for (size_t i = 0; i < candidates.size(); ++i) {
        auto& c = candidates[i];
        if (c.excluded || c.composite_score < config.min_viable) continue;
        if (best >= config.high_confidence && best - c.composite_score >= config.competitive_margin)
            continue;
        result.push_back(i);
    }
    return result;
}

} // namespace combatlog
