#pragma once

#include "data_types.hpp"

#include <cstddef>
#include <vector>

namespace acti {

// Heuristic sleep-window detection from the distribution of change in z-angle
// (van Hees 2018), evaluated per noon-to-noon day.
struct HdczaConfig {
    double epochLengthSeconds{5.0};
    double rollingWindowMinutes{5.0};
    double percentile{10.0};
    double multiplier{15.0};
    double minThreshold{0.13};     // degrees
    double maxThreshold{0.5};      // degrees
    double minBlockMinutes{30.0};
    double maxGapMinutes{60.0};
    std::size_t minDayEpochs{100};
    double sibAngleThreshold{5.0};
    double sibTimeThresholdMinutes{5.0};
};

struct HdczaResult {
    std::vector<SleepWindow> windows;   // one per day that produced a window
    SleepScoreSeries scores;            // 1 inside a window, per epoch
    std::vector<double> epochTimes;
    std::vector<double> angleChangeMedian;
    std::size_t validDays{0};
};

// Centred rolling median; NaN where the window is incomplete or holds a NaN.
std::vector<double> rollingMedian(const std::vector<double>& values, std::size_t window);

// Noon-to-noon day number of a local-clock timestamp.
long long noonDayIndex(double timestamp);

HdczaResult detectSleepWindowFromAngles(const std::vector<double>& angles,
                                        const std::vector<double>& epochTimes,
                                        const HdczaConfig& config = {});

HdczaResult detectSleepWindow(const RawSampleSet& raw, const HdczaConfig& config = {});

}  // namespace acti
