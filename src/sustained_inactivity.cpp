#include "sustained_inactivity.hpp"

#include "epochs.hpp"
#include "errors.hpp"
#include "metrics.hpp"

#include <cmath>
#include <stdexcept>

namespace acti {

std::size_t sibMinimumGapEpochs(const SibConfig& config) {
    if (config.epochLengthSeconds <= 0.0) {
        throw std::invalid_argument("Epoch length must be positive");
    }
    return static_cast<std::size_t>(config.timeThresholdMinutes * 60.0 / config.epochLengthSeconds);
}

std::vector<std::size_t> postureChanges(const std::vector<double>& angles, double thresholdDegrees) {
    std::vector<std::size_t> changes;
    for (std::size_t i = 0; i + 1 < angles.size(); ++i) {
        double a = angles[i];
        double b = angles[i + 1];
        if (std::isnan(a) || std::isnan(b)) {
            continue;
        }
        if (std::fabs(b - a) > thresholdDegrees) {
            changes.push_back(i);
        }
    }
    return changes;
}

std::vector<double> epochAngleZ(const RawSampleSet& raw, double epochLengthSeconds) {
    std::size_t perEpoch = samplesPerEpoch(raw.sampleRate, epochLengthSeconds);
    return epochMedians(computeAngle(raw.x, raw.y, raw.z, AngleAxis::Z), perEpoch);
}

SleepScoreSeries detectSustainedInactivity(const std::vector<double>& angles, const SibConfig& config) {
    if (angles.empty()) {
        throw InsufficientDataError("Angle series is empty");
    }

    SleepScoreSeries out;
    out.algorithm = "van_hees_2015_sib";
    out.parameters["angle_threshold"] = config.angleThresholdDegrees;
    out.parameters["time_threshold_minutes"] = config.timeThresholdMinutes;
    out.parameters["epoch_length_seconds"] = config.epochLengthSeconds;

    std::size_t minGap = sibMinimumGapEpochs(config);
    std::vector<std::size_t> changes = postureChanges(angles, config.angleThresholdDegrees);
    out.parameters["posture_changes"] = static_cast<double>(changes.size());

    // A series that never moved is one sustained bout.
    if (changes.size() < 2) {
        out.scores.assign(angles.size(), 1);
        return out;
    }

    out.scores.assign(angles.size(), 0);
    for (std::size_t k = 0; k + 1 < changes.size(); ++k) {
        std::size_t from = changes[k];
        std::size_t to = changes[k + 1];
        if (to - from > minGap) {
            for (std::size_t i = from + 1; i < to; ++i) {
                out.scores[i] = 1;
            }
        }
    }
    return out;
}

SleepScoreSeries detectSustainedInactivity(const RawSampleSet& raw, const SibConfig& config) {
    if (!raw.isConsistent()) {
        throw std::invalid_argument("Axis and timestamp arrays differ in length");
    }
    std::vector<double> angles = epochAngleZ(raw, config.epochLengthSeconds);
    if (angles.empty()) {
        throw InsufficientDataError("Not enough samples for even one epoch");
    }
    return detectSustainedInactivity(angles, config);
}

std::vector<int> resampleScores(const std::vector<int>& scores, double fromEpochSeconds, double toEpochSeconds) {
    if (fromEpochSeconds <= 0.0 || toEpochSeconds < fromEpochSeconds) {
        throw std::invalid_argument("Scores can only be resampled to an equal or coarser epoch");
    }
    double ratio = toEpochSeconds / fromEpochSeconds;
    auto factor = static_cast<std::size_t>(std::llround(ratio));
    if (std::fabs(ratio - static_cast<double>(factor)) > 1e-9) {
        throw std::invalid_argument("Target epoch must be a whole multiple of the source epoch");
    }

    std::vector<int> out;
    out.reserve(scores.size() / factor);
    for (std::size_t start = 0; start + factor <= scores.size(); start += factor) {
        int sleep = 0;
        for (std::size_t i = start; i < start + factor; ++i) {
            sleep += scores[i];
        }
        double share = static_cast<double>(sleep) / static_cast<double>(factor);
        out.push_back(share >= 0.5 ? 1 : 0);
    }
    return out;
}

}  // namespace acti
