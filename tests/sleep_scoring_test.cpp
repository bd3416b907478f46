#include "sleep_scoring.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

// ============================================================================
// Sadeh
// ============================================================================

TEST(Sadeh, ZeroCountsAreSleep) {
    acti::SleepScoreSeries series = acti::scoreSadeh(std::vector<double>(30, 0.0));
    ASSERT_EQ(series.scores.size(), 30u);
    for (int s : series.scores) {
        EXPECT_EQ(s, 1);
    }
    ASSERT_TRUE(series.confidence.has_value());
    EXPECT_NEAR((*series.confidence)[10], 7.601, 1e-12);
    EXPECT_EQ(series.algorithm, "sadeh_1994_actilife");
}

TEST(Sadeh, VariantThresholdsDiffer) {
    // PS at the centre is about -2.86: above the ActiLife threshold, below the original one.
    std::vector<double> counts(30, 110.0);
    acti::SleepScoreSeries actilife = acti::scoreSadeh(counts, "actilife");
    acti::SleepScoreSeries original = acti::scoreSadeh(counts, "original");
    EXPECT_EQ(actilife.scores[15], 1);
    EXPECT_EQ(original.scores[15], 0);
    EXPECT_DOUBLE_EQ(original.parameters.at("threshold"), 0.0);
}

TEST(Sadeh, CountScaledVariantDividesRawCounts) {
    std::vector<double> counts(30, 10000.0);
    EXPECT_EQ(acti::scoreSadeh(counts, "count_scaled").scores[15], 1);
    EXPECT_EQ(acti::scoreSadeh(counts, "actilife").scores[15], 0);
}

TEST(Sadeh, HandlesShortAndLongInputs) {
    EXPECT_EQ(acti::scoreSadeh({0.0}).scores.size(), 1u);
    std::vector<double> longRun(10000);
    for (std::size_t i = 0; i < longRun.size(); ++i) {
        longRun[i] = static_cast<double>((i * 37) % 400);
    }
    acti::SleepScoreSeries series = acti::scoreSadeh(longRun);
    EXPECT_EQ(series.scores.size(), 10000u);
    for (int s : series.scores) {
        EXPECT_TRUE(s == 0 || s == 1);
    }
}

// ============================================================================
// Cole-Kripke
// ============================================================================

TEST(ColeKripke, VariantScalingChangesOutcome) {
    std::vector<double> counts(20, 2.0);
    acti::SleepScoreSeries actilife = acti::scoreColeKripke(counts, "actilife");
    acti::SleepScoreSeries original = acti::scoreColeKripke(counts, "original");
    EXPECT_EQ(actilife.scores[10], 1);
    EXPECT_EQ(original.scores[10], 0);
    ASSERT_TRUE(original.confidence.has_value());
    EXPECT_NEAR((*original.confidence)[10], 1.33, 1e-9);
}

TEST(ColeKripke, EdgesArePaddedWithZeros) {
    std::vector<double> counts(10, 0.0);
    counts[0] = 1000.0;
    acti::SleepScoreSeries series = acti::scoreColeKripke(counts, "original");
    // Epoch 0 contributes to epochs 0..4 through the lag weights.
    EXPECT_EQ(series.scores[0], 0);
    EXPECT_EQ(series.scores[4], 0);
    EXPECT_EQ(series.scores[5], 1);
    EXPECT_EQ(acti::scoreColeKripke({5.0}).scores.size(), 1u);
}

TEST(ColeKripke, LongInputKeepsLength) {
    std::vector<double> longRun(10000);
    for (std::size_t i = 0; i < longRun.size(); ++i) {
        longRun[i] = static_cast<double>((i * 53) % 600);
    }
    for (const char* variant : {"actilife", "original", "count_scaled"}) {
        acti::SleepScoreSeries series = acti::scoreColeKripke(longRun, variant);
        ASSERT_EQ(series.scores.size(), 10000u) << variant;
        ASSERT_TRUE(series.confidence.has_value());
        EXPECT_EQ(series.confidence->size(), 10000u);
        for (int s : series.scores) {
            EXPECT_TRUE(s == 0 || s == 1);
        }
    }
}

// ============================================================================
// Input validation
// ============================================================================

TEST(SleepScoring, RejectsInvalidCounts) {
    EXPECT_THROW(acti::scoreSadeh({}), acti::InsufficientDataError);
    EXPECT_THROW(acti::scoreColeKripke({}), acti::InsufficientDataError);
    EXPECT_THROW(acti::scoreSadeh({1.0, std::nan(""), 2.0}), std::invalid_argument);
    EXPECT_THROW(acti::scoreColeKripke({1.0, -1.0}), std::invalid_argument);
    EXPECT_THROW(acti::scoreSadeh({1.0, INFINITY}), std::invalid_argument);
}

TEST(SleepScoring, UnknownVariantThrows) {
    EXPECT_THROW(acti::scoreSadeh({1.0}, "modern"), std::invalid_argument);
    EXPECT_THROW(acti::coleKripkeVariant("unknown"), std::invalid_argument);
    EXPECT_EQ(acti::sadehVariantNames().size(), 3u);
}
