#include "combatlog/feature_extractor.hpp"
#include "combatlog/tokenizer.hpp"
#include <algorithm>

namespace combatlog {

namespace {

// Payload positions after the event kind token
constexpr size_t kSpellNameField = 9;
constexpr size_t kExtraSpellNameField = 12;

bool is_primary_unit(const std::string& id, const std::string& primary,
                     const OwnershipIndex& index) {
    return same_actor(id, primary) || index.is_owned_by(id, primary);
}

} // namespace

void apply_event(const Event& event, const std::string& primary_actor,
                 const OwnershipIndex& index, const ExtractionRules& rules,
                 FeatureCounters& counters) {
    switch (event.kind) {
        case EventKind::CastSuccess:
            // Sub-agent casts are dropped
            if (same_actor(event.actor_id, primary_actor)) {
                counters.casts++;
                counters.spells_cast.push_back(event.field(kSpellNameField));
            }
            break;

        case EventKind::Dispel: {
            auto& spell = event.field(kSpellNameField);
            bool recognized = std::ranges::find(rules.dispel_spells, spell) !=
                              rules.dispel_spells.end();
            if (recognized && !same_actor(event.actor_id, primary_actor) &&
                index.is_owned_by(event.actor_id, primary_actor)) {
                counters.purges++;
                counters.spells_purged.push_back(event.field(kExtraSpellNameField));
            }
            break;
        }

        case EventKind::Interrupt:
            if (is_primary_unit(event.actor_id, primary_actor, index))
                counters.interrupts_performed++;
            if (is_primary_unit(event.target_id, primary_actor, index))
                counters.times_interrupted++;
            break;

        case EventKind::AuraApplied:
            if (event.field(kSpellNameField) == rules.tracked_buff) {
                if (same_actor(event.target_id, primary_actor))
                    counters.buff_gained_self++;
                else
                    counters.buff_gained_opponent++;
            }
            break;

        case EventKind::ActorEliminated:
            if (same_actor(event.target_id, primary_actor)) counters.times_died++;
            break;

        case EventKind::SessionStart:
        case EventKind::SessionEnd:
        case EventKind::Other:
            break;
    }
}

FeatureCounters extract_features(std::istream& log, const Interval& interval,
                                 const std::string& primary_actor,
                                 const OwnershipIndex& index,
                                 const ExtractionRules& rules) {
    FeatureCounters counters;
    std::string line;

    while (std::getline(log, line)) {
        auto ts = peek_timestamp(line);
        if (!ts || !interval.contains(*ts)) continue;

        auto event = tokenize_line(line);
        if (!event) continue;
        apply_event(*event, primary_actor, index, rules, counters);
    }

    return counters;
}

} // namespace combatlog
