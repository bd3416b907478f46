#pragma once

#include "data_types.hpp"

#include <vector>

namespace acti {

struct M5L5Config {
    double windowHours{5.0};
};

// Median spacing of consecutive timestamps. Throws std::invalid_argument when
// fewer than two timestamps exist or the spacing is not positive.
double estimateEpochSeconds(const std::vector<double>& timestamps);

// Most and least active windows of the average 24 h profile, searched circularly.
// Values: m5, l5, m5_start_hour, l5_start_hour, relative_amplitude.
CircadianMetrics computeM5L5(const std::vector<double>& values,
                             const std::vector<double>& timestamps,
                             const M5L5Config& config = {});

// Interdaily stability and intradaily variability from hourly means.
// Values: is, iv, hours.
CircadianMetrics computeInterdailyStability(const std::vector<double>& values, const std::vector<double>& timestamps);

// Sleep regularity index: agreement of the sleep/wake state 24 h apart, -100..100.
CircadianMetrics computeSleepRegularity(const std::vector<int>& scores, double epochLengthSeconds);

}  // namespace acti
