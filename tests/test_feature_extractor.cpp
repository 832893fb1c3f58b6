#include <gtest/gtest.h>
#include "combatlog/feature_extractor.hpp"
#include "log_fixtures.hpp"
#include <sstream>

using namespace combatlog;
using fixtures::at;
using fixtures::kOpponent;
using fixtures::kPet;
using fixtures::kPlayer;

namespace {

OwnershipIndex pet_index() {
    OwnershipIndex index;
    index.add("Felhunter", kPlayer);
    return index;
}

FeatureCounters extract(const fixtures::LogBuilder& log, int from = 0, int to = 300) {
    std::istringstream in(log.str());
    return extract_features(in, {at(from), at(to)}, kPlayer, pet_index());
}

} // namespace

TEST(FeatureExtractor, CountsPrimaryCasts) {
    fixtures::LogBuilder log;
    log.cast(10, kPlayer, "Chaos Bolt", kOpponent).cast(20, kPlayer, "Fear", kOpponent);

    auto counters = extract(log);
    EXPECT_EQ(counters.casts, 2);
    EXPECT_EQ(counters.spells_cast, (std::vector<std::string>{"Chaos Bolt", "Fear"}));
}

TEST(FeatureExtractor, SubAgentCastsAreDropped) {
    fixtures::LogBuilder log;
    log.cast(10, kPet, "Devour Magic", kOpponent).cast(12, kOpponent, "Kick", kPlayer);

    auto counters = extract(log);
    EXPECT_EQ(counters.casts, 0);
    EXPECT_TRUE(counters.spells_cast.empty());
}

TEST(FeatureExtractor, SubAgentDispelCountsAsPurge) {
    fixtures::LogBuilder log;
    log.dispel(15, kPet, kOpponent, "Devour Magic", "Power Word: Shield");

    auto counters = extract(log);
    EXPECT_EQ(counters.purges, 1);
    EXPECT_EQ(counters.spells_purged, (std::vector<std::string>{"Power Word: Shield"}));
    EXPECT_EQ(counters.casts, 0);
}

TEST(FeatureExtractor, PurgedNameSkipsExtraSpellId) {
    fixtures::LogBuilder log;
    log.raw(fixtures::stamp(at(20)) +
            "  SPELL_DISPEL,Creature-0-3131-0-0-417-00004E2A1B,\"Felhunter-4821\",0x1111,0x0,"
            "Player-3676-0A1B2C3D,\"Kaltor-Illidan-US\",0x548,0x0,"
            "19505,\"Devour Magic\",0x20,17,\"Power Word: Shield\",2,BUFF");

    auto counters = extract(log);
    EXPECT_EQ(counters.purges, 1);
    EXPECT_EQ(counters.spells_purged, (std::vector<std::string>{"Power Word: Shield"}));
}

TEST(FeatureExtractor, DispelNeedsRecognizedSpellAndOwnedSubAgent) {
    fixtures::LogBuilder log;
    log.dispel(10, kPlayer, kOpponent, "Devour Magic", "Blessing of Freedom")
       .dispel(11, kPet, kOpponent, "Purge", "Ice Barrier")
       .dispel(12, "Imp-1234", kOpponent, "Devour Magic", "Ice Barrier");

    auto counters = extract(log);
    EXPECT_EQ(counters.purges, 0);
    EXPECT_TRUE(counters.spells_purged.empty());
}

TEST(FeatureExtractor, DispelSpellsAreConfigurable) {
    fixtures::LogBuilder log;
    log.dispel(11, kPet, kOpponent, "Purge", "Ice Barrier");
    std::istringstream in(log.str());

    ExtractionRules rules;
    rules.dispel_spells = {"Devour Magic", "Purge"};
    auto counters = extract_features(in, {at(0), at(300)}, kPlayer, pet_index(), rules);
    EXPECT_EQ(counters.purges, 1);
}

TEST(FeatureExtractor, InterruptAttributionIsSymmetric) {
    fixtures::LogBuilder by_pet;
    by_pet.interrupt(30, kPet, kOpponent);
    fixtures::LogBuilder by_owner;
    by_owner.interrupt(30, kPlayer, kOpponent);

    auto pet_counters = extract(by_pet);
    auto owner_counters = extract(by_owner);
    EXPECT_EQ(pet_counters.interrupts_performed, 1);
    EXPECT_EQ(owner_counters.interrupts_performed, 1);
    EXPECT_EQ(pet_counters.times_interrupted, 0);
}

TEST(FeatureExtractor, TimesInterruptedCoversSubAgent) {
    fixtures::LogBuilder log;
    log.interrupt(30, kOpponent, kPlayer).interrupt(40, kOpponent, kPet);

    auto counters = extract(log);
    EXPECT_EQ(counters.times_interrupted, 2);
    EXPECT_EQ(counters.interrupts_performed, 0);
}

TEST(FeatureExtractor, TrackedBuffSplitsSelfAndOpponent) {
    fixtures::LogBuilder log;
    log.aura(50, kPlayer, kPlayer, "Precognition")
       .aura(60, kOpponent, kOpponent, "Precognition")
       .aura(61, kOpponent, fixtures::kOpponentHealer, "Precognition")
       .aura(70, kPlayer, kPlayer, "Dark Pact");

    auto counters = extract(log);
    EXPECT_EQ(counters.buff_gained_self, 1);
    EXPECT_EQ(counters.buff_gained_opponent, 2);
}

TEST(FeatureExtractor, CountsOwnDeathsOnly) {
    fixtures::LogBuilder log;
    log.died(100, kOpponent).died(200, kPlayer).died(201, kPet);

    auto counters = extract(log);
    EXPECT_EQ(counters.times_died, 1);
}

TEST(FeatureExtractor, IntervalIsClosedOnBothEnds) {
    fixtures::LogBuilder log;
    log.cast(-1, kPlayer, "Before")
       .cast(0, kPlayer, "AtStart")
       .cast(300, kPlayer, "AtEnd")
       .cast(301, kPlayer, "After");

    auto counters = extract(log, 0, 300);
    EXPECT_EQ(counters.spells_cast, (std::vector<std::string>{"AtStart", "AtEnd"}));
}

TEST(FeatureExtractor, IgnoresUnparsableAndUnrecognizedLines) {
    fixtures::LogBuilder log;
    log.raw("garbage")
       .raw("4/20/2025 19:00:10.000-4  SPELL_PERIODIC_DAMAGE,a,b,c,d,e,f")
       .raw("4/20/2025 19:00:11.000-4  SPELL_CAST_SUCCESS")
       .cast(20, kPlayer, "Fear");

    auto counters = extract(log);
    EXPECT_EQ(counters.casts, 1);
}

TEST(FeatureExtractor, ApplyEventMatchesStreamPass) {
    fixtures::LogBuilder log;
    log.cast(10, kPlayer, "Fear");

    Event event;
    event.kind = EventKind::CastSuccess;
    event.actor_id = kPlayer;
    event.fields.assign(10, "");
    event.fields[9] = "Fear";

    FeatureCounters counters;
    apply_event(event, kPlayer, pet_index(), ExtractionRules{}, counters);
    EXPECT_EQ(counters, extract(log));
}
