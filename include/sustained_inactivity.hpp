#pragma once

#include "data_types.hpp"

#include <cstddef>
#include <vector>

namespace acti {

struct SibConfig {
    double angleThresholdDegrees{5.0};
    double timeThresholdMinutes{5.0};
    double epochLengthSeconds{5.0};
};

std::size_t sibMinimumGapEpochs(const SibConfig& config);

// Indices i where |angle[i+1] - angle[i]| exceeds the threshold. Pairs with a
// NaN never count.
std::vector<std::size_t> postureChanges(const std::vector<double>& angles, double thresholdDegrees);

// Per-epoch median of the z inclination angle.
std::vector<double> epochAngleZ(const RawSampleSet& raw, double epochLengthSeconds);

SleepScoreSeries detectSustainedInactivity(const std::vector<double>& angles, const SibConfig& config = {});

SleepScoreSeries detectSustainedInactivity(const RawSampleSet& raw, const SibConfig& config = {});

// Majority vote (mean >= 0.5) over groups of fine epochs. A trailing partial
// group is dropped, matching the epochs aggregateEpochs keeps.
std::vector<int> resampleScores(const std::vector<int>& scores, double fromEpochSeconds, double toEpochSeconds);

}  // namespace acti
