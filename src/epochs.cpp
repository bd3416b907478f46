#include "epochs.hpp"

#include "errors.hpp"

#include <cmath>
#include <stdexcept>

namespace acti {

namespace {

template <typename Reducer>
std::vector<double> reduceEpochs(const std::vector<double>& values, std::size_t perEpoch, Reducer reduce) {
    std::vector<double> out;
    if (perEpoch == 0) {
        return out;
    }
    std::size_t epochs = values.size() / perEpoch;
    out.reserve(epochs);
    std::vector<double> window;
    window.reserve(perEpoch);
    for (std::size_t e = 0; e < epochs; ++e) {
        window.clear();
        for (std::size_t i = e * perEpoch; i < (e + 1) * perEpoch; ++i) {
            if (!std::isnan(values[i])) {
                window.push_back(values[i]);
            }
        }
        out.push_back(window.empty() ? quietNaN() : reduce(window));
    }
    return out;
}

}  // namespace

std::size_t samplesPerEpoch(double sampleRate, double epochLengthSeconds) {
    if (sampleRate <= 0.0 || epochLengthSeconds <= 0.0) {
        throw std::invalid_argument("Sample rate and epoch length must be positive");
    }
    return static_cast<std::size_t>(std::llround(sampleRate * epochLengthSeconds));
}

EpochSet aggregateEpochs(const RawSampleSet& raw, double epochLengthSeconds) {
    if (!raw.isConsistent()) {
        throw std::invalid_argument("Axis and timestamp arrays differ in length");
    }
    std::size_t perEpoch = samplesPerEpoch(raw.sampleRate, epochLengthSeconds);
    std::size_t epochs = perEpoch == 0 ? 0 : raw.size() / perEpoch;
    if (epochs == 0) {
        throw InsufficientDataError("Not enough samples for even one epoch (" + std::to_string(raw.size()) +
                                    " samples, " + std::to_string(perEpoch) + " per epoch)");
    }

    EpochSet set;
    set.samplesPerEpoch = perEpoch;
    EpochSummary* summaries[4] = {&set.x, &set.y, &set.z, &set.vectorMagnitude};
    EpochAxis axes[4] = {EpochAxis::X, EpochAxis::Y, EpochAxis::Z, EpochAxis::VectorMagnitude};
    for (int k = 0; k < 4; ++k) {
        summaries[k]->axis = axes[k];
        summaries[k]->epochLengthSeconds = epochLengthSeconds;
        summaries[k]->counts.assign(epochs, 0.0);
        summaries[k]->timestamps.reserve(epochs);
    }

    for (std::size_t e = 0; e < epochs; ++e) {
        std::size_t first = e * perEpoch;
        double sx = 0.0;
        double sy = 0.0;
        double sz = 0.0;
        double svm = 0.0;
        for (std::size_t i = first; i < first + perEpoch; ++i) {
            sx += std::fabs(raw.x[i]);
            sy += std::fabs(raw.y[i]);
            sz += std::fabs(raw.z[i]);
            svm += norm(raw.x[i], raw.y[i], raw.z[i]);
        }
        set.x.counts[e] = sx;
        set.y.counts[e] = sy;
        set.z.counts[e] = sz;
        set.vectorMagnitude.counts[e] = svm;
        for (auto* summary : summaries) {
            summary->timestamps.push_back(raw.timestamps[first]);
        }
    }
    return set;
}

std::vector<double> epochMedians(const std::vector<double>& values, std::size_t perEpoch) {
    return reduceEpochs(values, perEpoch, [](const std::vector<double>& w) { return median(w); });
}

std::vector<double> epochMeans(const std::vector<double>& values, std::size_t perEpoch) {
    return reduceEpochs(values, perEpoch, [](const std::vector<double>& w) { return mean(w); });
}

std::vector<double> epochStartTimes(const std::vector<double>& timestamps, std::size_t perEpoch) {
    std::vector<double> out;
    if (perEpoch == 0) {
        return out;
    }
    std::size_t epochs = timestamps.size() / perEpoch;
    out.reserve(epochs);
    for (std::size_t e = 0; e < epochs; ++e) {
        out.push_back(timestamps[e * perEpoch]);
    }
    return out;
}

}  // namespace acti
