#include "reference_backend.hpp"

#include "agreement.hpp"
#include "epochs.hpp"
#include "sleep_scoring.hpp"

#include <stdexcept>
#include <utility>

namespace acti {

ReferenceBackend::ReferenceBackend() : ReferenceBackend("reference", defaultCapabilities()) {}

ReferenceBackend::ReferenceBackend(std::string name, CapabilitySet capabilities)
    : ComputeBackend(std::move(name), capabilities) {}

CapabilitySet ReferenceBackend::defaultCapabilities() {
    CapabilitySet set = CapabilitySet::all();
    set.reset(Capability::ParallelProcessing);
    return set;
}

DeviceMetadata ReferenceBackend::readGt3xMetadata(const std::string& path) const {
    require(Capability::ParseGt3xMetadata);
    return acti::readGt3xMetadata(path);
}

RawSampleSet ReferenceBackend::readGt3x(const std::string& path, const Gt3xReadOptions& options) const {
    require(Capability::ParseGt3x);
    if (options.includeAuxiliary) {
        require(Capability::ParseGt3xSensors);
    }
    return acti::readGt3x(path, options);
}

std::vector<CalibrationFeature> ReferenceBackend::extractCalibrationFeatures(const RawSampleSet& raw,
                                                                             const CalibrationConfig& config) const {
    require(Capability::Calibration);
    return acti::extractCalibrationFeatures(raw, config);
}

CalibrationOutcome ReferenceBackend::calibrate(const RawSampleSet& raw, const CalibrationConfig& config) const {
    require(Capability::Calibration);
    return acti::calibrate(extractCalibrationFeatures(raw, config), config);
}

RawSampleSet ReferenceBackend::applyCalibration(const RawSampleSet& raw, const CalibrationOutcome& outcome) const {
    require(Capability::Calibration);
    return acti::applyCalibration(raw, outcome);
}

ImputationOutcome ReferenceBackend::imputeGaps(const RawSampleSet& raw, const ImputationConfig& config) const {
    require(Capability::Imputation);
    return acti::imputeGaps(raw, config);
}

EpochSet ReferenceBackend::aggregateEpochs(const RawSampleSet& raw, double epochLengthSeconds) const {
    require(Capability::Epoching);
    return acti::aggregateEpochs(raw, epochLengthSeconds);
}

MetricSeries ReferenceBackend::computeMetric(const std::string& name,
                                             const RawSampleSet& raw,
                                             const FilterConfig& config) const {
    auto capability = metricCapability(name);
    if (!capability) {
        throw std::invalid_argument("Unknown metric '" + name + "'");
    }
    require(*capability);
    return acti::computeMetric(name, raw, config, Execution::Sequential);
}

SleepScoreSeries ReferenceBackend::scoreSadeh(const std::vector<double>& counts, const std::string& variant) const {
    require(Capability::Sadeh);
    return acti::scoreSadeh(counts, variant);
}

SleepScoreSeries ReferenceBackend::scoreColeKripke(const std::vector<double>& counts,
                                                   const std::string& variant) const {
    require(Capability::ColeKripke);
    return acti::scoreColeKripke(counts, variant);
}

SleepScoreSeries ReferenceBackend::detectSustainedInactivity(const RawSampleSet& raw, const SibConfig& config) const {
    require(Capability::VanHeesSib);
    return acti::detectSustainedInactivity(raw, config);
}

HdczaResult ReferenceBackend::detectSleepWindow(const RawSampleSet& raw, const HdczaConfig& config) const {
    require(Capability::Hdcza);
    return acti::detectSleepWindow(raw, config);
}

SleepPeriodMetrics ReferenceBackend::sleepPeriodMetrics(const std::vector<int>& scores,
                                                        const std::vector<double>& counts,
                                                        std::size_t onset,
                                                        std::size_t offset,
                                                        double epochLengthSeconds) const {
    require(Capability::SleepPeriodMetrics);
    return computeSleepPeriodMetrics(scores, counts, onset, offset, epochLengthSeconds);
}

std::optional<SleepPeriod> ReferenceBackend::detectSleepPeriod(const std::vector<int>& scores,
                                                               const std::vector<double>& timestamps,
                                                               double startMarker,
                                                               double endMarker,
                                                               const ConsecutiveEpochsConfig& config) const {
    require(Capability::SleepPeriodDetection);
    return findConsecutiveSleepPeriod(scores, timestamps, startMarker, endMarker, config);
}

NonwearSeries ReferenceBackend::detectNonwearVanHees(const RawSampleSet& raw,
                                                     const VanHeesNonwearConfig& config) const {
    require(Capability::VanHeesNonwear);
    return acti::detectNonwearVanHees(raw, config);
}

NonwearSeries ReferenceBackend::detectNonwearChoi(const std::vector<double>& counts, const ChoiConfig& config) const {
    require(Capability::ChoiNonwear);
    return acti::detectNonwearChoi(counts, config);
}

NonwearSeries ReferenceBackend::detectNonwearCapsense(const RawSampleSet& raw, const CapsenseConfig& config) const {
    require(Capability::CapsenseNonwear);
    return acti::detectNonwearCapsense(raw, config);
}

NonwearOverlap ReferenceBackend::correlateSleepWithNonwear(const SleepWindow& window,
                                                           const NonwearSeries& nonwear,
                                                           const std::vector<double>& unitTimes) const {
    require(Capability::NonwearOverlap);
    return acti::correlateSleepWithNonwear(window, nonwear, unitTimes);
}

CircadianMetrics ReferenceBackend::computeM5L5(const std::vector<double>& values,
                                               const std::vector<double>& timestamps,
                                               const M5L5Config& config) const {
    require(Capability::M5L5);
    return acti::computeM5L5(values, timestamps, config);
}

CircadianMetrics ReferenceBackend::computeInterdailyStability(const std::vector<double>& values,
                                                              const std::vector<double>& timestamps) const {
    require(Capability::Ivis);
    return acti::computeInterdailyStability(values, timestamps);
}

CircadianMetrics ReferenceBackend::computeSleepRegularity(const std::vector<int>& scores,
                                                          double epochLengthSeconds) const {
    require(Capability::Sri);
    return acti::computeSleepRegularity(scores, epochLengthSeconds);
}

AgreementMetric ReferenceBackend::cohensKappa(const std::vector<int>& rater1, const std::vector<int>& rater2) const {
    require(Capability::CohensKappa);
    return acti::cohensKappa(rater1, rater2);
}

}  // namespace acti
