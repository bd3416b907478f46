#pragma once

#include "compute_backend.hpp"

namespace acti {

// Portable single-threaded implementation of every algorithm.
class ReferenceBackend : public ComputeBackend {
public:
    ReferenceBackend();

    static CapabilitySet defaultCapabilities();

    DeviceMetadata readGt3xMetadata(const std::string& path) const override;
    RawSampleSet readGt3x(const std::string& path, const Gt3xReadOptions& options) const override;

    std::vector<CalibrationFeature> extractCalibrationFeatures(const RawSampleSet& raw,
                                                               const CalibrationConfig& config) const override;
    CalibrationOutcome calibrate(const RawSampleSet& raw, const CalibrationConfig& config) const override;
    RawSampleSet applyCalibration(const RawSampleSet& raw, const CalibrationOutcome& outcome) const override;
    ImputationOutcome imputeGaps(const RawSampleSet& raw, const ImputationConfig& config) const override;
    EpochSet aggregateEpochs(const RawSampleSet& raw, double epochLengthSeconds) const override;

    MetricSeries computeMetric(const std::string& name,
                               const RawSampleSet& raw,
                               const FilterConfig& config) const override;

    SleepScoreSeries scoreSadeh(const std::vector<double>& counts, const std::string& variant) const override;
    SleepScoreSeries scoreColeKripke(const std::vector<double>& counts, const std::string& variant) const override;
    SleepScoreSeries detectSustainedInactivity(const RawSampleSet& raw, const SibConfig& config) const override;
    HdczaResult detectSleepWindow(const RawSampleSet& raw, const HdczaConfig& config) const override;
    SleepPeriodMetrics sleepPeriodMetrics(const std::vector<int>& scores,
                                          const std::vector<double>& counts,
                                          std::size_t onset,
                                          std::size_t offset,
                                          double epochLengthSeconds) const override;
    std::optional<SleepPeriod> detectSleepPeriod(const std::vector<int>& scores,
                                                 const std::vector<double>& timestamps,
                                                 double startMarker,
                                                 double endMarker,
                                                 const ConsecutiveEpochsConfig& config) const override;

    NonwearSeries detectNonwearVanHees(const RawSampleSet& raw, const VanHeesNonwearConfig& config) const override;
    NonwearSeries detectNonwearChoi(const std::vector<double>& counts, const ChoiConfig& config) const override;
    NonwearSeries detectNonwearCapsense(const RawSampleSet& raw, const CapsenseConfig& config) const override;
    NonwearOverlap correlateSleepWithNonwear(const SleepWindow& window,
                                             const NonwearSeries& nonwear,
                                             const std::vector<double>& unitTimes) const override;

    CircadianMetrics computeM5L5(const std::vector<double>& values,
                                 const std::vector<double>& timestamps,
                                 const M5L5Config& config) const override;
    CircadianMetrics computeInterdailyStability(const std::vector<double>& values,
                                                const std::vector<double>& timestamps) const override;
    CircadianMetrics computeSleepRegularity(const std::vector<int>& scores, double epochLengthSeconds) const override;

    AgreementMetric cohensKappa(const std::vector<int>& rater1, const std::vector<int>& rater2) const override;

protected:
    ReferenceBackend(std::string name, CapabilitySet capabilities);
};

}  // namespace acti
