#include "sleep_period_metrics.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace acti {

namespace {

bool allEqual(const std::vector<int>& scores, std::size_t from, std::size_t count, int value) {
    for (std::size_t k = 0; k < count; ++k) {
        if (scores[from + k] != value) {
            return false;
        }
    }
    return true;
}

struct MarkerSpan {
    std::size_t start{0};
    std::size_t end{0};
};

// First epoch at or after the start marker and last epoch at or before the end marker.
std::optional<MarkerSpan> markerSpan(const std::vector<double>& timestamps, double startMarker, double endMarker) {
    std::optional<std::size_t> startIdx;
    std::optional<std::size_t> endIdx;
    for (std::size_t i = 0; i < timestamps.size(); ++i) {
        if (!startIdx && timestamps[i] >= startMarker) {
            startIdx = i;
        }
        if (timestamps[i] <= endMarker) {
            endIdx = i;
        }
    }
    if (!startIdx || !endIdx) {
        return std::nullopt;
    }
    return MarkerSpan{*startIdx, *endIdx};
}

int stateValue(EpochState state) {
    return state == EpochState::Sleep ? 1 : 0;
}

}  // namespace

SleepPeriodMetrics computeSleepPeriodMetrics(const std::vector<int>& scores,
                                             const std::vector<double>& counts,
                                             std::size_t onset,
                                             std::size_t offset,
                                             double epochLengthSeconds) {
    if (scores.empty()) {
        throw std::invalid_argument("Sleep scores are empty");
    }
    if (scores.size() != counts.size()) {
        throw std::invalid_argument("Scores (" + std::to_string(scores.size()) + ") and counts (" +
                                    std::to_string(counts.size()) + ") differ in length");
    }
    if (onset >= scores.size() || offset >= scores.size()) {
        throw std::invalid_argument("Sleep period index out of range");
    }
    if (onset >= offset) {
        throw std::invalid_argument("Sleep onset must precede sleep offset");
    }
    if (epochLengthSeconds <= 0.0) {
        throw std::invalid_argument("Epoch length must be positive");
    }

    SleepPeriodMetrics m;
    const double epochMinutes = epochLengthSeconds / 60.0;
    const std::size_t epochs = offset - onset + 1;

    std::size_t sleepEpochs = 0;
    std::size_t sleepBouts = 0;
    std::size_t singleEpochBouts = 0;
    std::size_t boutLength = 0;
    bool inWake = false;
    bool sawSleep = false;
    m.firstSleepIndex = onset;
    m.lastSleepIndex = offset;

    for (std::size_t i = onset; i <= offset; ++i) {
        if (scores[i] == 1) {
            ++sleepEpochs;
            ++boutLength;
            inWake = false;
            if (!sawSleep) {
                m.firstSleepIndex = i;
                sawSleep = true;
            }
        } else {
            if (!inWake) {
                ++m.awakenings;
                inWake = true;
            }
            if (boutLength > 0) {
                ++sleepBouts;
                singleEpochBouts += boutLength == 1 ? 1 : 0;
                boutLength = 0;
            }
        }
        m.totalCounts += counts[i];
        if (counts[i] > 0.0) {
            ++m.nonzeroEpochs;
        }
    }
    if (boutLength > 0) {
        ++sleepBouts;
        singleEpochBouts += boutLength == 1 ? 1 : 0;
    }
    for (std::size_t i = offset + 1; i-- > onset;) {
        if (scores[i] == 1) {
            m.lastSleepIndex = i;
            break;
        }
    }

    m.timeInBedMinutes = static_cast<double>(epochs) * epochMinutes;
    m.totalSleepMinutes = static_cast<double>(sleepEpochs) * epochMinutes;
    m.wakeAfterOnsetMinutes = m.timeInBedMinutes - m.totalSleepMinutes;
    m.averageAwakeningMinutes = m.awakenings > 0 ? m.wakeAfterOnsetMinutes / static_cast<double>(m.awakenings) : 0.0;
    m.efficiencyPercent = m.totalSleepMinutes / m.timeInBedMinutes * 100.0;
    m.movementIndex = static_cast<double>(m.nonzeroEpochs) / static_cast<double>(epochs) * 100.0;
    m.fragmentationIndex =
        sleepBouts > 0 ? static_cast<double>(singleEpochBouts) / static_cast<double>(sleepBouts) * 100.0 : 0.0;
    m.sleepFragmentationIndex = m.movementIndex + m.fragmentationIndex;
    return m;
}

std::optional<SleepPeriod> findSleepPeriod(const std::vector<int>& scores,
                                           const std::vector<double>& timestamps,
                                           double startMarker,
                                           double endMarker,
                                           const TudorLockeConfig& config) {
    if (scores.size() != timestamps.size()) {
        throw std::invalid_argument("Scores and timestamps differ in length");
    }
    if (scores.empty()) {
        return std::nullopt;
    }

    std::optional<MarkerSpan> span = markerSpan(timestamps, startMarker, endMarker);
    if (!span) {
        return std::nullopt;
    }

    const std::size_t n = scores.size();
    const std::size_t ext = config.searchExtensionEpochs;
    std::size_t from = span->start > ext ? span->start - ext : 0;
    std::size_t to = std::min(n - 1, span->end + ext);

    const std::size_t need = config.onsetConsecutiveEpochs;
    if (need == 0 || need > n) {
        return std::nullopt;
    }
    std::optional<std::size_t> onset;
    for (std::size_t i = from; i <= std::min(to, n - need); ++i) {
        if (allEqual(scores, i, need, 1)) {
            onset = i;
            break;
        }
    }
    if (!onset) {
        return std::nullopt;
    }

    std::optional<std::size_t> offset;
    const std::size_t wakeNeed = config.offsetConsecutiveWakeEpochs;
    if (wakeNeed > 0 && wakeNeed <= n) {
        for (std::size_t i = *onset + need; i <= std::min(to, n - wakeNeed); ++i) {
            if (allEqual(scores, i, wakeNeed, 0) && i > *onset && scores[i - 1] == 1) {
                offset = i - 1;
                break;
            }
        }
    }
    if (!offset) {
        for (std::size_t i = to; i > *onset; --i) {
            if (scores[i] == 1) {
                offset = i;
                break;
            }
        }
    }
    if (!offset) {
        return std::nullopt;
    }
    return SleepPeriod{*onset, *offset};
}

ConsecutiveEpochsConfig consecutiveEpochsPreset(const std::string& name) {
    ConsecutiveEpochsConfig config;
    if (name == "onset3s_offset5s") {
        return config;
    }
    if (name == "onset5s_offset10s") {
        config.onsetEpochs = 5;
        config.offsetEpochs = 10;
        return config;
    }
    if (name == "tudor_locke_2014") {
        config.onsetEpochs = 5;
        config.offsetEpochs = 10;
        config.offsetState = EpochState::Wake;
        config.offsetAnchor = RunAnchor::Start;
        config.offsetPrecedingEpoch = true;
        return config;
    }
    throw std::invalid_argument("Unknown sleep period preset '" + name + "'");
}

std::vector<std::string> consecutiveEpochsPresetNames() {
    return {"onset3s_offset5s", "onset5s_offset10s", "tudor_locke_2014"};
}

std::optional<SleepPeriod> findConsecutiveSleepPeriod(const std::vector<int>& scores,
                                                      const std::vector<double>& timestamps,
                                                      double startMarker,
                                                      double endMarker,
                                                      const ConsecutiveEpochsConfig& config) {
    if (scores.size() != timestamps.size()) {
        throw std::invalid_argument("Scores and timestamps differ in length");
    }
    if (config.onsetEpochs == 0 || config.offsetEpochs == 0) {
        throw std::invalid_argument("Onset and offset runs need at least one epoch");
    }
    if (scores.empty()) {
        return std::nullopt;
    }
    std::optional<MarkerSpan> span = markerSpan(timestamps, startMarker, endMarker);
    if (!span) {
        return std::nullopt;
    }

    const std::size_t n = scores.size();
    const std::size_t ext = config.searchExtensionEpochs;
    const std::size_t from = span->start > ext ? span->start - ext : 0;
    const std::size_t to = std::min(n - 1, span->end + ext);

    std::optional<std::size_t> onset;
    const std::size_t onsetRun = config.onsetEpochs;
    if (onsetRun <= n) {
        const int target = stateValue(config.onsetState);
        for (std::size_t i = from; i <= std::min(to, n - onsetRun); ++i) {
            if (allEqual(scores, i, onsetRun, target)) {
                onset = config.onsetAnchor == RunAnchor::Start ? i : i + onsetRun - 1;
                break;
            }
        }
    }
    if (!onset) {
        return std::nullopt;
    }

    std::optional<std::size_t> offset;
    const std::size_t offsetRun = config.offsetEpochs;
    if (offsetRun <= n) {
        const int target = stateValue(config.offsetState);
        for (std::size_t i = *onset + onsetRun; i <= std::min(to, n - offsetRun); ++i) {
            if (!allEqual(scores, i, offsetRun, target)) {
                continue;
            }
            std::size_t candidate = config.offsetAnchor == RunAnchor::Start ? i : i + offsetRun - 1;
            if (config.offsetPrecedingEpoch) {
                candidate = i - 1;
                if (candidate < *onset) {
                    continue;
                }
            }
            // Candidates grow with i; the latest one wins.
            offset = candidate;
        }
    }
    if (!offset && config.offsetState == EpochState::Wake && config.offsetPrecedingEpoch) {
        for (std::size_t i = to; i > *onset; --i) {
            if (scores[i] == 1) {
                offset = i;
                break;
            }
        }
    }
    if (!offset) {
        return std::nullopt;
    }
    return SleepPeriod{*onset, *offset};
}

}  // namespace acti
