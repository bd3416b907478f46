#pragma once

#include "data_types.hpp"

#include <vector>

namespace acti {

std::size_t samplesPerEpoch(double sampleRate, double epochLengthSeconds);

// Per-axis absolute sums and vector-magnitude sums over complete epochs.
// Throws InsufficientDataError when no complete epoch fits.
EpochSet aggregateEpochs(const RawSampleSet& raw, double epochLengthSeconds);

// Per-epoch median of a per-sample series, NaN ignored. Trailing partial epoch dropped.
std::vector<double> epochMedians(const std::vector<double>& values, std::size_t samplesPerEpoch);

std::vector<double> epochMeans(const std::vector<double>& values, std::size_t samplesPerEpoch);

// Timestamp of the first sample of every complete epoch.
std::vector<double> epochStartTimes(const std::vector<double>& timestamps, std::size_t samplesPerEpoch);

}  // namespace acti
