#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace acti {

struct SleepPeriodMetrics {
    double timeInBedMinutes{0.0};
    double totalSleepMinutes{0.0};
    double wakeAfterOnsetMinutes{0.0};
    std::size_t awakenings{0};
    double averageAwakeningMinutes{0.0};
    double efficiencyPercent{0.0};
    double movementIndex{0.0};            // % epochs with count > 0
    double fragmentationIndex{0.0};       // % of sleep bouts lasting one epoch
    double sleepFragmentationIndex{0.0};  // movement + fragmentation
    double totalCounts{0.0};
    std::size_t nonzeroEpochs{0};
    std::size_t firstSleepIndex{0};
    std::size_t lastSleepIndex{0};
};

// Quality metrics for the period [onset, offset] (inclusive). Throws
// std::invalid_argument for mismatched lengths and out-of-range or inverted indices.
SleepPeriodMetrics computeSleepPeriodMetrics(const std::vector<int>& scores,
                                             const std::vector<double>& counts,
                                             std::size_t onset,
                                             std::size_t offset,
                                             double epochLengthSeconds = 60.0);

// Tudor-Locke (2014) onset/offset rule around a pair of approximate markers.
struct TudorLockeConfig {
    std::size_t onsetConsecutiveEpochs{5};
    std::size_t offsetConsecutiveWakeEpochs{10};
    std::size_t searchExtensionEpochs{5};
};

struct SleepPeriod {
    std::size_t onsetIndex{0};
    std::size_t offsetIndex{0};
};

// Onset is the first run of consecutive sleep; offset is the last sleep epoch
// before a run of consecutive wake, or the last sleep epoch of the search span.
std::optional<SleepPeriod> findSleepPeriod(const std::vector<int>& scores,
                                           const std::vector<double>& timestamps,
                                           double startMarker,
                                           double endMarker,
                                           const TudorLockeConfig& config = {});

enum class EpochState {
    Wake = 0,
    Sleep = 1
};

enum class RunAnchor {
    Start,  // first epoch of the run
    End     // last epoch of the run
};

// Onset and offset each sit on a run of consecutive epochs in a given state.
// The defaults are the 3-sleep onset / 5-sleep offset rule.
struct ConsecutiveEpochsConfig {
    std::size_t onsetEpochs{3};
    EpochState onsetState{EpochState::Sleep};
    RunAnchor onsetAnchor{RunAnchor::Start};
    std::size_t offsetEpochs{5};
    EpochState offsetState{EpochState::Sleep};
    RunAnchor offsetAnchor{RunAnchor::End};
    bool offsetPrecedingEpoch{false};  // report the epoch just before the offset run
    std::size_t searchExtensionEpochs{5};
};

// Presets: "onset3s_offset5s", "onset5s_offset10s" and "tudor_locke_2014".
// Throws std::invalid_argument for other names.
ConsecutiveEpochsConfig consecutiveEpochsPreset(const std::string& name);
std::vector<std::string> consecutiveEpochsPresetNames();

// Onset is the first qualifying run inside the marker span widened by the
// search extension. Offset is the latest qualifying run after the onset run;
// with a wake offset reported by its preceding epoch, the last sleep epoch of
// the span stands in when no run exists. Nullopt when either is missing.
std::optional<SleepPeriod> findConsecutiveSleepPeriod(const std::vector<int>& scores,
                                                      const std::vector<double>& timestamps,
                                                      double startMarker,
                                                      double endMarker,
                                                      const ConsecutiveEpochsConfig& config = {});

}  // namespace acti
