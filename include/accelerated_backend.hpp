#pragma once

#include "reference_backend.hpp"

#include <cstddef>

namespace acti {

// Multi-threaded backend. Element-wise and filtered metrics and calibration
// feature extraction run on worker threads; everything else is inherited.
// Available only when built with ACTICORE_ENABLE_ACCELERATED.
class AcceleratedBackend : public ReferenceBackend {
public:
    explicit AcceleratedBackend(std::size_t workers = 0);

    static bool compiledIn();

    bool isAvailable() const override { return compiledIn(); }
    std::size_t workers() const { return workers_; }

    std::vector<CalibrationFeature> extractCalibrationFeatures(const RawSampleSet& raw,
                                                               const CalibrationConfig& config) const override;
    MetricSeries computeMetric(const std::string& name,
                               const RawSampleSet& raw,
                               const FilterConfig& config) const override;

private:
    std::size_t workers_{1};
};

}  // namespace acti
