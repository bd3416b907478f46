#include "metrics.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

acti::RawSampleSet staticDevice(std::size_t n, double rate) {
    acti::RawSampleSet raw;
    raw.sampleRate = rate;
    raw.x.assign(n, 0.0);
    raw.y.assign(n, 0.0);
    raw.z.assign(n, 1.0);
    for (std::size_t i = 0; i < n; ++i) {
        raw.timestamps.push_back(static_cast<double>(i) / rate);
    }
    return raw;
}

acti::RawSampleSet wobblingDevice(std::size_t n, double rate) {
    acti::RawSampleSet raw = staticDevice(n, rate);
    for (std::size_t i = 0; i < n; ++i) {
        double t = static_cast<double>(i) / rate;
        raw.x[i] = 0.3 * std::sin(2.0 * acti::kPi * 1.5 * t);
        raw.y[i] = 0.1 * std::cos(2.0 * acti::kPi * 7.0 * t);
        raw.z[i] = 1.0 + 0.2 * std::sin(2.0 * acti::kPi * 0.5 * t);
    }
    return raw;
}

}  // namespace

// ============================================================================
// Point metrics
// ============================================================================

TEST(Metrics, EnmoOfStaticOrientations) {
    EXPECT_DOUBLE_EQ(acti::enmo(0.0, 0.0, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(acti::enmo(1.0, 0.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(acti::enmo(1.0, 1.0, 1.0), std::sqrt(3.0) - 1.0);
    EXPECT_DOUBLE_EQ(acti::enmo(0.1, 0.2, 0.3), 0.0);
}

TEST(Metrics, EnmoIsSignInvariantAndNonNegative) {
    std::vector<double> x{0.3, -0.3, 1.2, 0.0};
    std::vector<double> y{-0.8, 0.8, 0.4, 0.0};
    std::vector<double> z{0.9, -0.9, -0.1, 0.0};
    std::vector<double> nx, ny, nz;
    for (std::size_t i = 0; i < x.size(); ++i) {
        nx.push_back(-x[i]);
        ny.push_back(-y[i]);
        nz.push_back(-z[i]);
    }
    std::vector<double> a = acti::computeEnmo(x, y, z);
    std::vector<double> b = acti::computeEnmo(nx, ny, nz);
    ASSERT_EQ(a.size(), 4u);
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a[i], b[i]);
        EXPECT_GE(a[i], 0.0);
    }
}

TEST(Metrics, InclinationAngles) {
    EXPECT_DOUBLE_EQ(acti::inclinationAngle(0.0, 0.0, 1.0, acti::AngleAxis::Z), 90.0);
    EXPECT_DOUBLE_EQ(acti::inclinationAngle(0.0, 0.0, -1.0, acti::AngleAxis::Z), -90.0);
    EXPECT_DOUBLE_EQ(acti::inclinationAngle(0.0, 0.0, 1.0, acti::AngleAxis::X), 0.0);
    EXPECT_NEAR(acti::inclinationAngle(1.0, 0.0, 1.0, acti::AngleAxis::X), 45.0, 1e-12);

    std::vector<double> angles = acti::computeAngle({0.0, 1.0}, {1.0, 0.0}, {0.0, 0.0}, acti::AngleAxis::Y);
    ASSERT_EQ(angles.size(), 2u);
    EXPECT_DOUBLE_EQ(angles[0], 90.0);
    EXPECT_DOUBLE_EQ(angles[1], 0.0);
}

TEST(Metrics, MismatchedAxesThrow) {
    EXPECT_THROW(acti::computeEnmo({1.0, 2.0}, {1.0}, {1.0}), std::invalid_argument);
}

// ============================================================================
// Filtered metrics
// ============================================================================

TEST(Metrics, HighCutoffDropsBelowNyquist) {
    acti::FilterConfig config;
    EXPECT_DOUBLE_EQ(acti::effectiveHighCutoff(20.0, config), 9.0);
    EXPECT_DOUBLE_EQ(acti::effectiveHighCutoff(100.0, config), 15.0);
}

TEST(Metrics, FilteredMetricsVanishOnStaticDevice) {
    acti::RawSampleSet raw = staticDevice(3000, 100.0);
    for (const char* name : {"lfenmo", "hfen", "bfen"}) {
        acti::MetricSeries series = acti::computeMetric(name, raw);
        ASSERT_EQ(series.values.size(), raw.size()) << name;
        EXPECT_NEAR(series.values.back(), 0.0, 1e-3) << name;
        EXPECT_DOUBLE_EQ(series.parameters.at("order"), 4.0);
    }
    acti::MetricSeries plus = acti::computeMetric("hfenplus", raw);
    EXPECT_NEAR(plus.values.back(), 0.0, 1e-3);
}

TEST(Metrics, DispatchByName) {
    acti::RawSampleSet raw = staticDevice(10, 10.0);
    acti::MetricSeries angle = acti::computeMetric("anglez", raw);
    EXPECT_EQ(angle.name, "anglez");
    EXPECT_DOUBLE_EQ(angle.values[4], 90.0);
    ASSERT_TRUE(angle.timestamps.has_value());
    EXPECT_EQ(*angle.timestamps, raw.timestamps);
    EXPECT_DOUBLE_EQ(angle.parameters.at("sample_rate"), 10.0);

    EXPECT_THROW(acti::computeMetric("mad", raw), std::invalid_argument);
    EXPECT_EQ(acti::metricNames().size(), 8u);
    EXPECT_TRUE(acti::isFilteredMetric("bfen"));
    EXPECT_FALSE(acti::isFilteredMetric("enmo"));
}

TEST(Metrics, ParallelMatchesSequential) {
    acti::RawSampleSet raw = wobblingDevice(20000, 100.0);
    for (const std::string& name : acti::metricNames()) {
        acti::MetricSeries seq = acti::computeMetric(name, raw, {}, acti::Execution::Sequential);
        acti::MetricSeries par = acti::computeMetric(name, raw, {}, acti::Execution::Parallel);
        EXPECT_EQ(seq.values, par.values) << name;
    }
}
