#include <gtest/gtest.h>
#include "combatlog/disambiguator.hpp"
#include "log_fixtures.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

using namespace combatlog;
using namespace std::chrono;
using fixtures::at;

namespace {

Candidate candidate(int start_secs, int duration_secs, double proximity, int scan_index) {
    Candidate c;
    c.start.timestamp = at(start_secs);
    SessionMarker end;
    end.timestamp = at(start_secs + duration_secs);
    end.boundary = Boundary::End;
    c.end = end;
    c.duration = seconds(duration_secs);
    c.proximity_score = proximity;
    c.scan_index = scan_index;
    c.composite_score = 1.0;
    return c;
}

double duration_score(int candidate_secs, int declared_secs) {
    return std::max(0.0, 1.0 - std::abs(candidate_secs - declared_secs) / 300.0);
}

std::vector<Event> eliminations_from(const fixtures::LogBuilder& log, int from, int to) {
    std::istringstream in(log.str());
    return collect_eliminations(in, {at(from), at(to)});
}

} // namespace

TEST(Disambiguator, CollectsEliminationsInsideInterval) {
    fixtures::LogBuilder log;
    log.died(-1, fixtures::kOpponent)
       .died(0, fixtures::kOpponent)
       .cast(50, fixtures::kPlayer, "Fear")
       .died(120, fixtures::kPlayer)
       .died(121, fixtures::kOpponentHealer);

    auto eliminations = eliminations_from(log, 0, 120);
    ASSERT_EQ(eliminations.size(), 2u);
    EXPECT_EQ(eliminations[0].target_id, fixtures::kOpponent);
    EXPECT_EQ(eliminations[1].target_id, fixtures::kPlayer);
}

TEST(Disambiguator, CrossSourceScoreIsMatchedFraction) {
    fixtures::LogBuilder log;
    log.died(32, fixtures::kOpponent).died(58, fixtures::kOpponentHealer).died(200, fixtures::kPlayer);
    auto eliminations = eliminations_from(log, 0, 300);

    std::vector<GroundTruthEvent> truth = {
        {fixtures::kOpponent, 30.0},
        {fixtures::kOpponentHealer, 60.0},
        {fixtures::kPlayer, 90.0},
    };
    EXPECT_NEAR(cross_source_score(eliminations, at(0), truth, seconds(10)), 2.0 / 3.0, 1e-9);
}

TEST(Disambiguator, CrossSourceRequiresSameActor) {
    fixtures::LogBuilder log;
    log.died(30, fixtures::kOpponentHealer);
    auto eliminations = eliminations_from(log, 0, 300);

    std::vector<GroundTruthEvent> truth = {{fixtures::kOpponent, 30.0}};
    EXPECT_DOUBLE_EQ(cross_source_score(eliminations, at(0), truth, seconds(10)), 0.0);
}

TEST(Disambiguator, CrossSourceMatchesShortNames) {
    fixtures::LogBuilder log;
    log.died(30, fixtures::kOpponent);
    auto eliminations = eliminations_from(log, 0, 300);

    std::vector<GroundTruthEvent> truth = {{"Kaltor", 25.0}};
    EXPECT_DOUBLE_EQ(cross_source_score(eliminations, at(0), truth, seconds(10)), 1.0);
}

TEST(Disambiguator, EachLogEventMatchesOnce) {
    fixtures::LogBuilder log;
    log.died(30, fixtures::kOpponent);
    auto eliminations = eliminations_from(log, 0, 300);

    std::vector<GroundTruthEvent> truth = {{fixtures::kOpponent, 30.0}, {fixtures::kOpponent, 31.0}};
    EXPECT_DOUBLE_EQ(cross_source_score(eliminations, at(0), truth, seconds(10)), 0.5);
}

TEST(Disambiguator, NoGroundTruthScoresZero) {
    EXPECT_DOUBLE_EQ(cross_source_score({}, at(0), {}, seconds(10)), 0.0);
}

TEST(Disambiguator, EmptyCompetitiveSetIsNoConfidentMatch) {
    std::istringstream in("");
    std::vector<Candidate> candidates = {candidate(0, 240, 1.0, 0)};
    auto record = fixtures::make_record(0, 240);

    auto result = disambiguate(in, candidates, {}, record, ResolverConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::NoConfidentMatch);
}

TEST(Disambiguator, FallsBackToProximityWhenNothingDiscriminates) {
    std::istringstream in("");
    auto record = fixtures::make_record(0, 240);
    std::vector<Candidate> candidates = {candidate(0, 240, 0.9, 0), candidate(300, 240, 0.95, 1)};
    for (auto& c : candidates) c.duration_score = duration_score(240, 240);

    auto result = disambiguate(in, candidates, {0, 1}, record, ResolverConfig{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1u);
}

TEST(Disambiguator, EqualProximityBreaksOnScanOrder) {
    std::istringstream in("");
    auto record = fixtures::make_record(150, 240);
    std::vector<Candidate> candidates = {candidate(0, 240, 0.875, 0), candidate(300, 240, 0.875, 1)};
    for (auto& c : candidates) c.duration_score = 1.0;

    auto result = disambiguate(in, candidates, {1, 0}, record, ResolverConfig{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 0u);
}

TEST(Disambiguator, DurationDecidesWithoutGroundTruth) {
    std::istringstream in("");
    auto record = fixtures::make_record(0, 240);
    std::vector<Candidate> candidates = {candidate(0, 400, 0.99, 0), candidate(420, 250, 0.65, 1)};
    candidates[0].duration_score = duration_score(400, 240);
    candidates[1].duration_score = duration_score(250, 240);

    auto result = disambiguate(in, candidates, {0, 1}, record, ResolverConfig{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1u);
}

TEST(Disambiguator, DurationsInsideTieBandFallBackToProximity) {
    std::istringstream in("");
    auto record = fixtures::make_record(2, 208);
    std::vector<Candidate> candidates = {candidate(0, 200, 0.998, 0), candidate(300, 210, 0.75, 1)};
    candidates[0].duration_score = duration_score(200, 208);
    candidates[1].duration_score = duration_score(210, 208);

    auto result = disambiguate(in, candidates, {0, 1}, record, ResolverConfig{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 0u);

    // Outside the band the closer duration wins again
    ResolverConfig strict;
    strict.scoring.duration_tie_band = seconds(0);
    std::istringstream again("");
    result = disambiguate(again, candidates, {0, 1}, record, strict);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1u);
}

TEST(Disambiguator, GroundTruthOutranksProximity) {
    fixtures::LogBuilder log;
    log.start(0, 1505, "3v3")
       .died(120, "Nobody-Else-US")
       .end(240, 240)
       .start(300, 1505, "3v3")
       .died(340, fixtures::kOpponent)
       .died(395, fixtures::kOpponentHealer)
       .died(480, fixtures::kPlayer)
       .end(540, 240);
    std::istringstream in(log.str());

    auto record = fixtures::make_record(148, 240);
    record.ground_truth_events = {
        {fixtures::kOpponent, 40.0},
        {fixtures::kOpponentHealer, 95.0},
        {fixtures::kPlayer, 180.0},
    };

    std::vector<Candidate> candidates = {candidate(0, 240, 0.877, 0), candidate(300, 240, 0.873, 1)};
    for (auto& c : candidates) c.duration_score = 1.0;

    std::vector<std::string> trace;
    auto result = disambiguate(in, candidates, {0, 1}, record, ResolverConfig{},
                               [&](const std::string& m) { trace.push_back(m); });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 1u);
    EXPECT_DOUBLE_EQ(candidates[0].cross_source_score, 0.0);
    EXPECT_DOUBLE_EQ(candidates[1].cross_source_score, 1.0);
    EXPECT_EQ(candidates[0].elimination_count, 1);
    EXPECT_EQ(candidates[1].elimination_count, 3);
    EXPECT_FALSE(trace.empty());
}
