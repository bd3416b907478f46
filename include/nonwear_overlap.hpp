#pragma once

#include "data_types.hpp"

#include <cstddef>
#include <vector>

namespace acti {

// Closed interval of timestamps, seconds.
struct TimeRange {
    double start{0.0};
    double end{0.0};

    bool contains(double t) const { return start <= t && t <= end; }
    bool overlaps(const TimeRange& other) const { return !(end < other.start || start > other.end); }
};

struct NonwearOverlap {
    bool onsetInNonwear{false};
    bool offsetInNonwear{false};
    std::size_t overlappingPeriods{0};
};

// Converts index ranges to time ranges. unitTimes holds one timestamp per
// unit of the series (sample, epoch or capsense record); a range ends at the
// timestamp of its last unit.
std::vector<TimeRange> nonwearTimeRanges(const NonwearSeries& series, const std::vector<double>& unitTimes);

bool inNonwear(double t, const std::vector<TimeRange>& periods);
std::size_t countOverlappingPeriods(const TimeRange& range, const std::vector<TimeRange>& periods);

// Whether onset and offset fall inside nonwear, and how many nonwear periods
// touch [onset, offset]. Throws std::invalid_argument when offset < onset.
NonwearOverlap correlateSleepWithNonwear(double onset, double offset, const std::vector<TimeRange>& periods);

NonwearOverlap correlateSleepWithNonwear(const SleepWindow& window,
                                         const NonwearSeries& series,
                                         const std::vector<double>& unitTimes);

}  // namespace acti
