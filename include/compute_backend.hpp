#pragma once

#include "calibration.hpp"
#include "capabilities.hpp"
#include "circadian.hpp"
#include "data_types.hpp"
#include "gt3x_reader.hpp"
#include "hdcza.hpp"
#include "imputation.hpp"
#include "metrics.hpp"
#include "nonwear.hpp"
#include "nonwear_overlap.hpp"
#include "sleep_period_metrics.hpp"
#include "sustained_inactivity.hpp"

#include <optional>
#include <string>
#include <vector>

namespace acti {

// Capability a metric name requires, or nullopt for unknown names.
std::optional<Capability> metricCapability(const std::string& name);

// Interface shared by every processing backend. The capability set is fixed
// when the backend is constructed. Every operation not overridden throws
// CapabilityUnsupportedError.
class ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    const std::string& name() const { return name_; }
    const CapabilitySet& capabilities() const { return capabilities_; }
    bool supports(Capability capability) const { return capabilities_.test(capability); }
    virtual bool isAvailable() const { return true; }

    virtual DeviceMetadata readGt3xMetadata(const std::string& path) const;
    virtual RawSampleSet readGt3x(const std::string& path, const Gt3xReadOptions& options) const;

    virtual std::vector<CalibrationFeature> extractCalibrationFeatures(const RawSampleSet& raw,
                                                                       const CalibrationConfig& config) const;
    virtual CalibrationOutcome calibrate(const RawSampleSet& raw, const CalibrationConfig& config) const;
    virtual RawSampleSet applyCalibration(const RawSampleSet& raw, const CalibrationOutcome& outcome) const;
    virtual ImputationOutcome imputeGaps(const RawSampleSet& raw, const ImputationConfig& config) const;
    virtual EpochSet aggregateEpochs(const RawSampleSet& raw, double epochLengthSeconds) const;

    virtual MetricSeries computeMetric(const std::string& name,
                                       const RawSampleSet& raw,
                                       const FilterConfig& config) const;

    virtual SleepScoreSeries scoreSadeh(const std::vector<double>& counts, const std::string& variant) const;
    virtual SleepScoreSeries scoreColeKripke(const std::vector<double>& counts, const std::string& variant) const;
    virtual SleepScoreSeries detectSustainedInactivity(const RawSampleSet& raw, const SibConfig& config) const;
    virtual HdczaResult detectSleepWindow(const RawSampleSet& raw, const HdczaConfig& config) const;
    virtual SleepPeriodMetrics sleepPeriodMetrics(const std::vector<int>& scores,
                                                  const std::vector<double>& counts,
                                                  std::size_t onset,
                                                  std::size_t offset,
                                                  double epochLengthSeconds) const;
    virtual std::optional<SleepPeriod> detectSleepPeriod(const std::vector<int>& scores,
                                                         const std::vector<double>& timestamps,
                                                         double startMarker,
                                                         double endMarker,
                                                         const ConsecutiveEpochsConfig& config) const;

    virtual NonwearSeries detectNonwearVanHees(const RawSampleSet& raw, const VanHeesNonwearConfig& config) const;
    virtual NonwearSeries detectNonwearChoi(const std::vector<double>& counts, const ChoiConfig& config) const;
    virtual NonwearSeries detectNonwearCapsense(const RawSampleSet& raw, const CapsenseConfig& config) const;
    virtual NonwearOverlap correlateSleepWithNonwear(const SleepWindow& window,
                                                     const NonwearSeries& nonwear,
                                                     const std::vector<double>& unitTimes) const;

    virtual CircadianMetrics computeM5L5(const std::vector<double>& values,
                                         const std::vector<double>& timestamps,
                                         const M5L5Config& config) const;
    virtual CircadianMetrics computeInterdailyStability(const std::vector<double>& values,
                                                        const std::vector<double>& timestamps) const;
    virtual CircadianMetrics computeSleepRegularity(const std::vector<int>& scores, double epochLengthSeconds) const;

    virtual AgreementMetric cohensKappa(const std::vector<int>& rater1, const std::vector<int>& rater2) const;

protected:
    ComputeBackend(std::string name, CapabilitySet capabilities);

    // Throws CapabilityUnsupportedError unless the capability is in the set.
    void require(Capability capability) const;

private:
    std::string name_;
    CapabilitySet capabilities_;
};

}  // namespace acti
