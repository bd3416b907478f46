#include "nonwear_overlap.hpp"

#include <algorithm>
#include <stdexcept>

namespace acti {

std::vector<TimeRange> nonwearTimeRanges(const NonwearSeries& series, const std::vector<double>& unitTimes) {
    if (series.nonwear.size() != unitTimes.size()) {
        throw std::invalid_argument("Nonwear flags and unit timestamps differ in length");
    }
    std::vector<TimeRange> periods;
    periods.reserve(series.ranges.size());
    for (const NonwearRange& r : series.ranges) {
        if (r.end < r.start || r.end >= unitTimes.size()) {
            throw std::invalid_argument("Nonwear range lies outside the series");
        }
        periods.push_back(TimeRange{unitTimes[r.start], unitTimes[r.end]});
    }
    return periods;
}

bool inNonwear(double t, const std::vector<TimeRange>& periods) {
    return std::any_of(periods.begin(), periods.end(), [t](const TimeRange& p) { return p.contains(t); });
}

std::size_t countOverlappingPeriods(const TimeRange& range, const std::vector<TimeRange>& periods) {
    return static_cast<std::size_t>(
        std::count_if(periods.begin(), periods.end(), [&range](const TimeRange& p) { return range.overlaps(p); }));
}

NonwearOverlap correlateSleepWithNonwear(double onset, double offset, const std::vector<TimeRange>& periods) {
    if (offset < onset) {
        throw std::invalid_argument("Sleep offset precedes onset");
    }
    NonwearOverlap out;
    out.onsetInNonwear = inNonwear(onset, periods);
    out.offsetInNonwear = inNonwear(offset, periods);
    out.overlappingPeriods = countOverlappingPeriods(TimeRange{onset, offset}, periods);
    return out;
}

NonwearOverlap correlateSleepWithNonwear(const SleepWindow& window,
                                         const NonwearSeries& series,
                                         const std::vector<double>& unitTimes) {
    return correlateSleepWithNonwear(window.onsetTime, window.offsetTime, nonwearTimeRanges(series, unitTimes));
}

}  // namespace acti
