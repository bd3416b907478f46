#include "accelerated_backend.hpp"

#include "parallel.hpp"

#include <stdexcept>

namespace acti {

AcceleratedBackend::AcceleratedBackend(std::size_t workers)
    : ReferenceBackend("accelerated", CapabilitySet::all()),
      workers_(workers == 0 ? hardwareWorkers() : workers) {}

bool AcceleratedBackend::compiledIn() {
#if defined(ACTICORE_ACCELERATED) && ACTICORE_ACCELERATED
    return true;
#else
    return false;
#endif
}

std::vector<CalibrationFeature> AcceleratedBackend::extractCalibrationFeatures(const RawSampleSet& raw,
                                                                               const CalibrationConfig& config) const {
    require(Capability::Calibration);
    if (!raw.isConsistent()) {
        throw std::invalid_argument("Axis and timestamp arrays differ in length");
    }
    std::size_t window = calibrationWindowLength(raw.sampleRate, config.windowSeconds);
    if (window == 0) {
        return {};
    }
    std::vector<CalibrationFeature> features(raw.size() / window);
    parallelFor(features.size(), workers_, [&](std::size_t begin, std::size_t end) {
        for (std::size_t w = begin; w < end; ++w) {
            features[w] = computeWindowFeature(raw, w * window, window);
        }
    }, 16);
    return features;
}

MetricSeries AcceleratedBackend::computeMetric(const std::string& name,
                                               const RawSampleSet& raw,
                                               const FilterConfig& config) const {
    auto capability = metricCapability(name);
    if (!capability) {
        throw std::invalid_argument("Unknown metric '" + name + "'");
    }
    require(*capability);
    return acti::computeMetric(name, raw, config, Execution::Parallel);
}

}  // namespace acti
