#include "imputation.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace {

// Ten samples at 10 Hz, a four-second hole, then two more samples.
acti::RawSampleSet gappySamples() {
    acti::RawSampleSet raw;
    raw.sampleRate = 10.0;
    for (int i = 0; i < 10; ++i) {
        raw.timestamps.push_back(i * 0.1);
        raw.x.push_back(0.0);
        raw.y.push_back(0.0);
        raw.z.push_back(1.0);
    }
    raw.z[9] = 2.0;
    for (double t : {5.0, 5.1}) {
        raw.timestamps.push_back(t);
        raw.x.push_back(1.0);
        raw.y.push_back(0.0);
        raw.z.push_back(0.0);
    }
    return raw;
}

}  // namespace

// ============================================================================
// Gap filling
// ============================================================================

TEST(Imputation, ReplicatesLastSampleAcrossGap) {
    acti::ImputationOutcome out = acti::imputeGaps(gappySamples());

    EXPECT_EQ(out.gapCount, 1u);
    ASSERT_EQ(out.gaps.size(), 1u);
    EXPECT_EQ(out.gaps[0].index, 9u);
    EXPECT_EQ(out.gaps[0].samplesInserted, 40u);
    EXPECT_NEAR(out.gaps[0].durationSeconds, 4.1, 1e-9);
    EXPECT_NEAR(out.totalGapSeconds, 4.1, 1e-9);
    EXPECT_EQ(out.samplesAdded, 40u);
    ASSERT_EQ(out.x.size(), 52u);
    ASSERT_EQ(out.timestamps.size(), 52u);

    // The row before the gap and every copy of it are rescaled to unit norm.
    EXPECT_DOUBLE_EQ(out.z[8], 1.0);
    EXPECT_DOUBLE_EQ(out.z[9], 1.0);
    EXPECT_TRUE(out.gaps[0].normalized);
    EXPECT_DOUBLE_EQ(out.z[10], 1.0);
    EXPECT_DOUBLE_EQ(out.z[49], 1.0);
    EXPECT_DOUBLE_EQ(out.x[50], 1.0);
    EXPECT_DOUBLE_EQ(out.x[51], 1.0);
}

TEST(Imputation, RegeneratesUniformTimestamps) {
    acti::ImputationOutcome out = acti::imputeGaps(gappySamples());
    ASSERT_EQ(out.timestamps.size(), 52u);
    EXPECT_DOUBLE_EQ(out.timestamps.front(), 0.0);
    for (std::size_t k = 1; k < out.timestamps.size(); ++k) {
        EXPECT_NEAR(out.timestamps[k] - out.timestamps[k - 1], 0.1, 1e-9);
    }
    EXPECT_NEAR(out.timestamps.back(), 5.1, 1e-9);
}

TEST(Imputation, NormalizationCanBeDisabled) {
    acti::ImputationConfig config;
    config.normalizeReplicatedRows = false;
    acti::ImputationOutcome out = acti::imputeGaps(gappySamples(), config);
    EXPECT_FALSE(out.gaps[0].normalized);
    EXPECT_DOUBLE_EQ(out.z[9], 2.0);
    EXPECT_DOUBLE_EQ(out.z[10], 2.0);
}

TEST(Imputation, GapLengthIsCapped) {
    acti::ImputationConfig config;
    config.maxGapMinutes = 0.05;  // 3 s, 30 samples
    acti::ImputationOutcome out = acti::imputeGaps(gappySamples(), config);
    EXPECT_EQ(out.gaps[0].samplesInserted, 29u);
    EXPECT_EQ(out.x.size(), 41u);
}

TEST(Imputation, NoGapsLeavesDataUntouched) {
    acti::RawSampleSet raw = gappySamples();
    raw.timestamps.resize(10);
    raw.x.resize(10);
    raw.y.resize(10);
    raw.z.resize(10);
    acti::ImputationOutcome out = acti::imputeGaps(raw);
    EXPECT_EQ(out.gapCount, 0u);
    EXPECT_EQ(out.samplesAdded, 0u);
    EXPECT_EQ(out.x, raw.x);
    EXPECT_EQ(out.z, raw.z);
    EXPECT_EQ(out.timestamps, raw.timestamps);
}

// ============================================================================
// Zero samples
// ============================================================================

namespace {

acti::RawSampleSet withZeroRows() {
    acti::RawSampleSet raw;
    raw.sampleRate = 10.0;
    for (int i = 0; i < 8; ++i) {
        raw.timestamps.push_back(i * 0.1);
        raw.x.push_back(static_cast<double>(i));
        raw.y.push_back(0.0);
        raw.z.push_back(1.0);
    }
    for (std::size_t i : {0u, 3u, 4u, 7u}) {
        raw.x[i] = 0.0;
        raw.z[i] = 0.0;
    }
    return raw;
}

}  // namespace

TEST(Imputation, ZeroRowsAreCleaned) {
    acti::RawSampleSet raw = withZeroRows();
    acti::ImputationOutcome out = acti::imputeGaps(raw);

    EXPECT_EQ(out.zerosReplaced, 4u);
    EXPECT_EQ(out.gapCount, 0u);
    EXPECT_EQ(out.samplesAdded, 0u);

    // Leading row becomes (0, 0, 1), rows 3 and 4 are dropped, the last row
    // repeats row 6.
    EXPECT_EQ(out.x, (std::vector<double>{0.0, 1.0, 2.0, 5.0, 6.0, 6.0}));
    EXPECT_EQ(out.z, (std::vector<double>{1.0, 1.0, 1.0, 1.0, 1.0, 1.0}));
    EXPECT_EQ(out.timestamps, (std::vector<double>{raw.timestamps[0], raw.timestamps[1], raw.timestamps[2],
                                                   raw.timestamps[5], raw.timestamps[6], raw.timestamps[7]}));
}

TEST(Imputation, ZeroHandlingCanBeDisabled) {
    acti::RawSampleSet raw = withZeroRows();
    acti::ImputationConfig config;
    config.replaceZeroSamples = false;
    acti::ImputationOutcome out = acti::imputeGaps(raw, config);
    EXPECT_EQ(out.zerosReplaced, 0u);
    EXPECT_EQ(out.x, raw.x);
    EXPECT_EQ(out.z, raw.z);
}

TEST(Imputation, DroppedZerosCanOpenAGap) {
    acti::RawSampleSet raw;
    raw.sampleRate = 10.0;
    for (int i = 0; i < 30; ++i) {
        raw.timestamps.push_back(i * 0.1);
        bool zero = i >= 5 && i < 25;
        raw.x.push_back(0.0);
        raw.y.push_back(0.0);
        raw.z.push_back(zero ? 0.0 : 1.0);
    }
    acti::ImputationOutcome out = acti::imputeGaps(raw);
    EXPECT_EQ(out.zerosReplaced, 20u);
    ASSERT_EQ(out.gapCount, 1u);
    EXPECT_EQ(out.gaps[0].index, 4u);
    EXPECT_EQ(out.gaps[0].samplesInserted, 20u);
    EXPECT_EQ(out.x.size(), 30u);
    EXPECT_EQ(out.samplesAdded, 20u);
}

TEST(Imputation, WithImputationKeepsSampleRate) {
    acti::RawSampleSet raw = gappySamples();
    acti::RawSampleSet filled = acti::withImputation(raw, acti::imputeGaps(raw));
    EXPECT_EQ(filled.size(), 52u);
    EXPECT_TRUE(filled.isConsistent());
    EXPECT_DOUBLE_EQ(filled.sampleRate, 10.0);
}

TEST(Imputation, RejectsInconsistentInput) {
    acti::RawSampleSet raw = gappySamples();
    raw.x.pop_back();
    EXPECT_THROW(acti::imputeGaps(raw), std::invalid_argument);

    acti::RawSampleSet noRate = gappySamples();
    noRate.sampleRate = 0.0;
    EXPECT_THROW(acti::imputeGaps(noRate), std::invalid_argument);
}
