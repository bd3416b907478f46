#include "nonwear.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

// Still, moving and still again in 15-minute blocks at 10 Hz, plus a partial tail.
acti::RawSampleSet stillMovingStill() {
    acti::RawSampleSet raw;
    raw.sampleRate = 10.0;
    const std::size_t block = 9000;
    const std::size_t n = 3 * block + 500;
    for (std::size_t i = 0; i < n; ++i) {
        double t = static_cast<double>(i) / raw.sampleRate;
        raw.timestamps.push_back(t);
        bool moving = i >= block && i < 2 * block;
        raw.x.push_back(moving ? 0.5 * std::sin(2.0 * acti::kPi * 0.7 * t) : 0.0);
        raw.y.push_back(moving ? 0.5 * std::cos(2.0 * acti::kPi * 0.7 * t) : 0.0);
        raw.z.push_back(moving ? 1.0 + 0.3 * std::sin(2.0 * acti::kPi * 1.3 * t) : 1.0);
    }
    return raw;
}

std::vector<double> repeated(std::vector<double> counts, std::size_t n, double value) {
    counts.insert(counts.end(), n, value);
    return counts;
}

}  // namespace

// ============================================================================
// van Hees
// ============================================================================

TEST(VanHeesNonwear, FlagsStillWindows) {
    acti::RawSampleSet raw = stillMovingStill();
    acti::NonwearSeries series = acti::detectNonwearVanHees(raw);

    ASSERT_EQ(series.nonwear.size(), raw.size());
    ASSERT_EQ(series.ranges.size(), 2u);
    EXPECT_EQ(series.ranges[0].start, 0u);
    EXPECT_EQ(series.ranges[0].end, 8999u);
    EXPECT_EQ(series.ranges[1].start, 18000u);
    EXPECT_EQ(series.ranges[1].end, 26999u);
    EXPECT_FALSE(series.nonwear.back());
    EXPECT_EQ(series.algorithm, "van_hees_2023");

    std::vector<int> scores = acti::vanHeesWindowScores(raw);
    ASSERT_EQ(scores.size(), 3u);
    EXPECT_EQ(scores[0], 3);
    EXPECT_EQ(scores[1], 0);
}

TEST(VanHeesNonwear, LongerWindowsOfOlderParameterSet) {
    acti::VanHeesNonwearConfig config = acti::vanHeesParameterSet("van_hees_2013");
    EXPECT_DOUBLE_EQ(config.windowSeconds, 1800.0);
    EXPECT_DOUBLE_EQ(config.sdCriterion, 0.003);
    acti::NonwearSeries series = acti::detectNonwearVanHees(stillMovingStill(), config);
    EXPECT_TRUE(series.ranges.empty());
    EXPECT_THROW(acti::vanHeesParameterSet("van_hees_2030"), std::invalid_argument);
}

// ============================================================================
// Choi
// ============================================================================

TEST(ChoiNonwear, ToleratesIsolatedSpike) {
    std::vector<double> counts = repeated({}, 100, 50.0);
    counts = repeated(counts, 120, 0.0);
    counts[160] = 10.0;
    counts = repeated(counts, 100, 50.0);

    acti::NonwearSeries series = acti::detectNonwearChoi(counts);
    ASSERT_EQ(series.ranges.size(), 1u);
    EXPECT_EQ(series.ranges[0].start, 100u);
    EXPECT_EQ(series.ranges[0].end, 219u);
    EXPECT_TRUE(series.nonwear[160]);
    EXPECT_EQ(series.algorithm, "choi_2011");
}

TEST(ChoiNonwear, ShortZeroRunIsWear) {
    std::vector<double> counts = repeated({}, 100, 50.0);
    counts = repeated(counts, 50, 0.0);
    counts = repeated(counts, 100, 50.0);
    acti::NonwearSeries series = acti::detectNonwearChoi(counts);
    EXPECT_TRUE(series.ranges.empty());
    EXPECT_EQ(series.nonwear.size(), 250u);
}

TEST(ChoiNonwear, RejectsInvalidCounts) {
    EXPECT_THROW(acti::detectNonwearChoi({1.0, -2.0}), std::invalid_argument);
    EXPECT_THROW(acti::detectNonwearChoi({std::nan("")}), std::invalid_argument);
    EXPECT_TRUE(acti::detectNonwearChoi({}).nonwear.empty());
}

// ============================================================================
// Capacitive sensor
// ============================================================================

TEST(CapsenseNonwear, FollowsSkinContact) {
    acti::CapsenseChannel channel;
    channel.state = {1, 1, 0, 0, 0, 1, 0, 1};
    acti::NonwearSeries series = acti::detectNonwearCapsense(channel);
    ASSERT_EQ(series.ranges.size(), 2u);
    EXPECT_EQ(series.ranges[0].start, 2u);
    EXPECT_EQ(series.ranges[0].end, 4u);
    EXPECT_EQ(series.ranges[1].start, 6u);
    EXPECT_EQ(series.ranges[1].end, 6u);

    acti::CapsenseConfig config;
    config.minimumRunRecords = 2;
    acti::NonwearSeries filtered = acti::detectNonwearCapsense(channel, config);
    ASSERT_EQ(filtered.ranges.size(), 1u);
    EXPECT_EQ(filtered.ranges[0].end, 4u);
    EXPECT_FALSE(filtered.nonwear[6]);
}

TEST(CapsenseNonwear, MissingChannelThrows) {
    acti::RawSampleSet raw;
    EXPECT_THROW(acti::detectNonwearCapsense(raw), std::invalid_argument);
}
