#include <gtest/gtest.h>
#include "combatlog/boundary_scanner.hpp"
#include "log_fixtures.hpp"
#include <sstream>

using namespace combatlog;
using namespace std::chrono;
using fixtures::at;

namespace {

TimeWindow window(int from, int to) {
    return {at(from), at(to)};
}

} // namespace

TEST(BoundaryScanner, SearchWindowWidensByReliability) {
    ResolverConfig config;
    auto record = fixtures::make_record(0, 300);

    record.reliability = Reliability::High;
    auto w = search_window(record, config);
    EXPECT_EQ(w.begin, at(-630));
    EXPECT_EQ(w.end, at(930));

    record.reliability = Reliability::Low;
    w = search_window(record, config);
    EXPECT_EQ(w.begin, at(-900));
    EXPECT_EQ(w.end, at(1200));
}

TEST(BoundaryScanner, ExtractsStartAndEndMarkers) {
    fixtures::LogBuilder log;
    log.start(0, 1505, "3v3")
       .cast(100, fixtures::kPlayer, "Shadow Bolt")
       .end(245, 245);
    std::istringstream in(log.str());

    auto markers = scan_boundaries(in, window(-60, 1000), ResolverConfig{});
    ASSERT_EQ(markers.size(), 2u);

    EXPECT_EQ(markers[0].boundary, Boundary::Start);
    EXPECT_EQ(markers[0].timestamp, at(0));
    EXPECT_EQ(markers[0].location_id, 1505);
    EXPECT_EQ(markers[0].location_name, "Nagrand");
    EXPECT_EQ(markers[0].declared_category, "3v3");
    EXPECT_EQ(markers[0].session_type, SessionType::Standard);

    EXPECT_EQ(markers[1].boundary, Boundary::End);
    ASSERT_TRUE(markers[1].reported_duration.has_value());
    EXPECT_EQ(*markers[1].reported_duration, seconds(245));
}

TEST(BoundaryScanner, IgnoresMarkersOutsideWindow) {
    fixtures::LogBuilder log;
    log.start(-5000, 572, "2v2").end(-4800, 200)
       .start(0, 1505, "3v3").end(240, 240)
       .start(5000, 980, "3v3");
    std::istringstream in(log.str());

    auto markers = scan_boundaries(in, window(-60, 1000), ResolverConfig{});
    ASSERT_EQ(markers.size(), 2u);
    EXPECT_EQ(markers[0].location_id, 1505);
}

TEST(BoundaryScanner, UnknownZoneGetsPlaceholderName) {
    fixtures::LogBuilder log;
    log.start(0, 9999, "3v3");
    std::istringstream in(log.str());

    auto markers = scan_boundaries(in, window(-60, 60), ResolverConfig{});
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0].location_name, "Zone_9999");
}

TEST(BoundaryScanner, MarksContinuousSessions) {
    fixtures::LogBuilder log;
    log.start(0, 1505, "Rated Solo Shuffle");
    std::istringstream in(log.str());

    auto markers = scan_boundaries(in, window(-60, 60), ResolverConfig{});
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0].session_type, SessionType::ContinuousMultiRound);
}

TEST(BoundaryScanner, KeepsFileOrder) {
    fixtures::LogBuilder log;
    log.start(100, 1505, "3v3").start(10, 572, "2v2");
    std::istringstream in(log.str());

    auto markers = scan_boundaries(in, window(-60, 1000), ResolverConfig{});
    ASSERT_EQ(markers.size(), 2u);
    EXPECT_EQ(markers[0].location_id, 1505);
    EXPECT_EQ(markers[1].location_id, 572);
}

TEST(BoundaryScanner, CountsSkippedLines) {
    fixtures::LogBuilder log;
    log.raw("not a combat log line")
       .start(0, 1505, "3v3")
       .raw("")
       .cast(30, fixtures::kPlayer, "Fear")
       .end(240, 240)
       .start(9000, 1505, "3v3");
    std::istringstream in(log.str());

    ScanStats stats;
    auto markers = scan_boundaries(in, window(-60, 1000), ResolverConfig{}, &stats);
    EXPECT_EQ(markers.size(), 2u);
    EXPECT_EQ(stats.lines_read, 6);
    EXPECT_EQ(stats.lines_in_window, 3);
    EXPECT_EQ(stats.lines_skipped, 2);
}

TEST(BoundaryScanner, EmptyLogYieldsNoMarkers) {
    std::istringstream in("");
    EXPECT_TRUE(scan_boundaries(in, window(0, 100), ResolverConfig{}).empty());
}
