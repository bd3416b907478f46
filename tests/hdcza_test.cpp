#include "hdcza.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

constexpr double kNoon = 43200.0;
constexpr double kEpoch = 5.0;
constexpr std::size_t kEpochsPerDay = 17280;

// One noon-to-noon day of restless posture with an eight-hour still stretch.
void restlessDayWithNight(std::vector<double>& angles, std::vector<double>& times) {
    angles.resize(kEpochsPerDay);
    times.resize(kEpochsPerDay);
    for (std::size_t i = 0; i < kEpochsPerDay; ++i) {
        times[i] = kNoon + static_cast<double>(i) * kEpoch;
        angles[i] = (i % 2 == 0) ? 20.0 : -20.0;
        if (i >= 7200 && i < 12960) {
            angles[i] = 0.0;
        }
    }
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

TEST(Hdcza, RollingMedianIsCentred) {
    std::vector<double> out = acti::rollingMedian({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
    ASSERT_EQ(out.size(), 5u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_DOUBLE_EQ(out[1], 2.0);
    EXPECT_DOUBLE_EQ(out[2], 3.0);
    EXPECT_DOUBLE_EQ(out[3], 4.0);
    EXPECT_TRUE(std::isnan(out[4]));

    std::vector<double> withNaN = acti::rollingMedian({1.0, std::nan(""), 3.0, 4.0, 5.0}, 3);
    EXPECT_TRUE(std::isnan(withNaN[1]));
    EXPECT_TRUE(std::isnan(withNaN[2]));
    EXPECT_DOUBLE_EQ(withNaN[3], 4.0);

    EXPECT_THROW(acti::rollingMedian({1.0}, 0), std::invalid_argument);
}

TEST(Hdcza, NoonDayBoundaries) {
    EXPECT_EQ(acti::noonDayIndex(43199.0), -1);
    EXPECT_EQ(acti::noonDayIndex(43200.0), 0);
    EXPECT_EQ(acti::noonDayIndex(43200.0 + 86399.0), 0);
    EXPECT_EQ(acti::noonDayIndex(43200.0 + 86400.0), 1);
}

// ============================================================================
// Window detection
// ============================================================================

TEST(Hdcza, FindsStillNight) {
    std::vector<double> angles;
    std::vector<double> times;
    restlessDayWithNight(angles, times);

    acti::HdczaResult result = acti::detectSleepWindowFromAngles(angles, times);
    EXPECT_EQ(result.validDays, 1u);
    ASSERT_EQ(result.windows.size(), 1u);

    const acti::SleepWindow& w = result.windows[0];
    double expectedOnset = kNoon + 7200.0 * kEpoch;
    double expectedOffset = kNoon + 12959.0 * kEpoch;
    EXPECT_NEAR(w.onsetTime, expectedOnset, 300.0);
    EXPECT_NEAR(w.offsetTime, expectedOffset, 300.0);
    EXPECT_GT(w.efficiencyPercent, 95.0);
    EXPECT_NEAR(w.totalSleepMinutes + w.wakeAfterOnsetMinutes,
                static_cast<double>(w.offsetIndex - w.onsetIndex + 1) * kEpoch / 60.0, 1e-9);
    EXPECT_EQ(w.method, "hdcza");

    ASSERT_EQ(result.scores.scores.size(), kEpochsPerDay);
    EXPECT_EQ(result.scores.scores[w.onsetIndex], 1);
    EXPECT_EQ(result.scores.scores[100], 0);
}

TEST(Hdcza, MotionlessNightIsFullySlept) {
    std::vector<double> angles(1440, 0.0);
    std::vector<double> times(1440);
    for (std::size_t i = 0; i < times.size(); ++i) {
        times[i] = kNoon + static_cast<double>(i) * kEpoch;
    }
    acti::HdczaResult result = acti::detectSleepWindowFromAngles(angles, times);
    ASSERT_EQ(result.windows.size(), 1u);
    const acti::SleepWindow& w = result.windows[0];
    EXPECT_GT(w.totalSleepMinutes, 30.0);
    EXPECT_DOUBLE_EQ(w.wakeAfterOnsetMinutes, 0.0);
    EXPECT_DOUBLE_EQ(w.efficiencyPercent, 100.0);
}

TEST(Hdcza, DayWithoutDefinedMediansIsValidButEmpty) {
    std::vector<double> angles(150, 0.0);
    std::vector<double> times(150);
    for (std::size_t i = 0; i < times.size(); ++i) {
        times[i] = kNoon + static_cast<double>(i) * kEpoch;
    }
    acti::HdczaConfig config;
    config.rollingWindowMinutes = 60.0;
    acti::HdczaResult result = acti::detectSleepWindowFromAngles(angles, times, config);
    EXPECT_EQ(result.validDays, 1u);
    EXPECT_TRUE(result.windows.empty());
}

TEST(Hdcza, ShortRecordingIsInsufficient) {
    std::vector<double> angles(50, 0.0);
    std::vector<double> times(50);
    for (std::size_t i = 0; i < times.size(); ++i) {
        times[i] = kNoon + static_cast<double>(i) * kEpoch;
    }
    EXPECT_THROW(acti::detectSleepWindowFromAngles(angles, times), acti::InsufficientDataError);
    EXPECT_THROW(acti::detectSleepWindowFromAngles(angles, {1.0}), std::invalid_argument);
}
