#include "hdcza.hpp"

#include "epochs.hpp"
#include "errors.hpp"
#include "sustained_inactivity.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace acti {

namespace {

// Rolling-median value that never qualifies as a block.
constexpr double kMissingChange = 999.0;
// Days with fewer defined rolling-median values produce no window.
constexpr std::size_t kMinThresholdValues = 10;

struct Block {
    std::size_t start{0};
    std::size_t end{0};  // inclusive
    double durationSeconds{0.0};
};

std::vector<Block> findBlocks(const std::vector<double>& rolling,
                              const std::vector<double>& times,
                              std::size_t first,
                              std::size_t last,
                              double threshold) {
    std::vector<Block> blocks;
    std::size_t i = first;
    while (i < last) {
        double v = std::isnan(rolling[i]) ? kMissingChange : rolling[i];
        if (v >= threshold) {
            ++i;
            continue;
        }
        std::size_t j = i;
        while (j + 1 < last) {
            double next = std::isnan(rolling[j + 1]) ? kMissingChange : rolling[j + 1];
            if (next >= threshold) {
                break;
            }
            ++j;
        }
        blocks.push_back(Block{i, j, times[j] - times[i]});
        i = j + 1;
    }
    return blocks;
}

std::vector<Block> mergeBlocks(const std::vector<Block>& blocks, const std::vector<double>& times, double maxGapSeconds) {
    std::vector<Block> merged;
    if (blocks.empty()) {
        return merged;
    }
    Block current = blocks.front();
    for (std::size_t k = 1; k < blocks.size(); ++k) {
        const Block& next = blocks[k];
        if (times[next.start] - times[current.end] <= maxGapSeconds) {
            current.end = next.end;
            current.durationSeconds = times[current.end] - times[current.start];
        } else {
            merged.push_back(current);
            current = next;
        }
    }
    merged.push_back(current);
    return merged;
}

}  // namespace

std::vector<double> rollingMedian(const std::vector<double>& values, std::size_t window) {
    if (window == 0) {
        throw std::invalid_argument("Rolling window must hold at least one value");
    }
    const std::size_t n = values.size();
    const std::size_t offset = (window - 1) / 2;
    std::vector<double> out(n, quietNaN());
    std::vector<double> buffer;
    buffer.reserve(window);
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t end = i + offset;
        if (end >= n || end + 1 < window) {
            continue;
        }
        buffer.assign(values.begin() + static_cast<std::ptrdiff_t>(end + 1 - window),
                      values.begin() + static_cast<std::ptrdiff_t>(end + 1));
        if (std::any_of(buffer.begin(), buffer.end(), [](double v) { return std::isnan(v); })) {
            continue;
        }
        out[i] = median(buffer);
    }
    return out;
}

long long noonDayIndex(double timestamp) {
    return static_cast<long long>(std::floor((timestamp - 43200.0) / 86400.0));
}

HdczaResult detectSleepWindowFromAngles(const std::vector<double>& angles,
                                        const std::vector<double>& epochTimes,
                                        const HdczaConfig& config) {
    if (angles.size() != epochTimes.size()) {
        throw std::invalid_argument("Angle and timestamp arrays differ in length");
    }
    if (angles.empty()) {
        throw InsufficientDataError("Angle series is empty");
    }
    if (config.epochLengthSeconds <= 0.0) {
        throw std::invalid_argument("Epoch length must be positive");
    }

    const std::size_t n = angles.size();
    std::vector<double> change(n, quietNaN());
    for (std::size_t i = 1; i < n; ++i) {
        change[i] = std::fabs(angles[i] - angles[i - 1]);
    }
    auto window = static_cast<std::size_t>(config.rollingWindowMinutes * 60.0 / config.epochLengthSeconds);

    HdczaResult result;
    result.epochTimes = epochTimes;
    result.angleChangeMedian = rollingMedian(change, std::max<std::size_t>(window, 1));
    result.scores.algorithm = "hdcza";
    result.scores.scores.assign(n, 0);
    result.scores.parameters["percentile"] = config.percentile;
    result.scores.parameters["multiplier"] = config.multiplier;
    result.scores.parameters["min_block_minutes"] = config.minBlockMinutes;
    result.scores.parameters["max_gap_minutes"] = config.maxGapMinutes;
    result.scores.parameters["epoch_length_seconds"] = config.epochLengthSeconds;

    SibConfig sibConfig;
    sibConfig.angleThresholdDegrees = config.sibAngleThreshold;
    sibConfig.timeThresholdMinutes = config.sibTimeThresholdMinutes;
    sibConfig.epochLengthSeconds = config.epochLengthSeconds;
    SleepScoreSeries sib = detectSustainedInactivity(angles, sibConfig);

    const std::vector<double>& rolling = result.angleChangeMedian;
    const double epochMinutes = config.epochLengthSeconds / 60.0;

    std::size_t dayStart = 0;
    while (dayStart < n) {
        long long day = noonDayIndex(epochTimes[dayStart]);
        std::size_t dayEnd = dayStart;
        while (dayEnd < n && noonDayIndex(epochTimes[dayEnd]) == day) {
            ++dayEnd;
        }
        std::size_t first = dayStart;
        dayStart = dayEnd;

        if (dayEnd - first < config.minDayEpochs) {
            continue;
        }
        ++result.validDays;

        std::vector<double> defined;
        for (std::size_t i = first; i < dayEnd; ++i) {
            if (!std::isnan(rolling[i])) {
                defined.push_back(rolling[i]);
            }
        }
        if (defined.size() < kMinThresholdValues) {
            continue;
        }
        double threshold = percentile(defined, config.percentile) * config.multiplier;
        threshold = std::clamp(threshold, config.minThreshold, config.maxThreshold);

        std::vector<Block> blocks;
        for (const Block& b : findBlocks(rolling, epochTimes, first, dayEnd, threshold)) {
            if (b.durationSeconds >= config.minBlockMinutes * 60.0) {
                blocks.push_back(b);
            }
        }
        if (blocks.empty()) {
            continue;
        }
        std::vector<Block> merged = mergeBlocks(blocks, epochTimes, config.maxGapMinutes * 60.0);
        Block longest = merged.front();
        for (const Block& b : merged) {
            if (b.durationSeconds > longest.durationSeconds) {
                longest = b;
            }
        }

        std::size_t sleepEpochs = 0;
        for (std::size_t i = longest.start; i <= longest.end; ++i) {
            result.scores.scores[i] = 1;
            sleepEpochs += static_cast<std::size_t>(sib.scores[i]);
        }

        SleepWindow w;
        w.onsetIndex = longest.start;
        w.offsetIndex = longest.end;
        w.onsetTime = epochTimes[longest.start];
        w.offsetTime = epochTimes[longest.end];
        double windowMinutes = static_cast<double>(longest.end - longest.start + 1) * epochMinutes;
        w.totalSleepMinutes = static_cast<double>(sleepEpochs) * epochMinutes;
        w.wakeAfterOnsetMinutes = windowMinutes - w.totalSleepMinutes;
        w.efficiencyPercent = windowMinutes > 0.0 ? w.totalSleepMinutes / windowMinutes * 100.0 : 0.0;
        w.method = "hdcza";
        result.windows.push_back(w);
    }

    if (result.validDays == 0) {
        throw InsufficientDataError("No valid day segments found in data");
    }
    return result;
}

HdczaResult detectSleepWindow(const RawSampleSet& raw, const HdczaConfig& config) {
    if (!raw.isConsistent()) {
        throw std::invalid_argument("Axis and timestamp arrays differ in length");
    }
    std::vector<double> angles = epochAngleZ(raw, config.epochLengthSeconds);
    std::vector<double> times =
        epochStartTimes(raw.timestamps, samplesPerEpoch(raw.sampleRate, config.epochLengthSeconds));
    return detectSleepWindowFromAngles(angles, times, config);
}

}  // namespace acti
