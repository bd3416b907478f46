#include "compute_backend.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace acti {

std::optional<Capability> metricCapability(const std::string& name) {
    if (name == "enmo") {
        return Capability::Enmo;
    }
    if (name == "anglex" || name == "angley" || name == "anglez") {
        return Capability::Angles;
    }
    if (name == "lfenmo") {
        return Capability::Lfenmo;
    }
    if (name == "hfen") {
        return Capability::Hfen;
    }
    if (name == "bfen") {
        return Capability::Bfen;
    }
    if (name == "hfenplus") {
        return Capability::HfenPlus;
    }
    return std::nullopt;
}

ComputeBackend::ComputeBackend(std::string name, CapabilitySet capabilities)
    : name_(std::move(name)), capabilities_(capabilities) {}

void ComputeBackend::require(Capability capability) const {
    if (!supports(capability)) {
        throw CapabilityUnsupportedError(name_, capability);
    }
}

DeviceMetadata ComputeBackend::readGt3xMetadata(const std::string&) const {
    throw CapabilityUnsupportedError(name_, Capability::ParseGt3xMetadata);
}

RawSampleSet ComputeBackend::readGt3x(const std::string&, const Gt3xReadOptions&) const {
    throw CapabilityUnsupportedError(name_, Capability::ParseGt3x);
}

std::vector<CalibrationFeature> ComputeBackend::extractCalibrationFeatures(const RawSampleSet&,
                                                                           const CalibrationConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::Calibration);
}

CalibrationOutcome ComputeBackend::calibrate(const RawSampleSet&, const CalibrationConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::Calibration);
}

RawSampleSet ComputeBackend::applyCalibration(const RawSampleSet&, const CalibrationOutcome&) const {
    throw CapabilityUnsupportedError(name_, Capability::Calibration);
}

ImputationOutcome ComputeBackend::imputeGaps(const RawSampleSet&, const ImputationConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::Imputation);
}

EpochSet ComputeBackend::aggregateEpochs(const RawSampleSet&, double) const {
    throw CapabilityUnsupportedError(name_, Capability::Epoching);
}

MetricSeries ComputeBackend::computeMetric(const std::string& name, const RawSampleSet&, const FilterConfig&) const {
    auto capability = metricCapability(name);
    if (!capability) {
        throw std::invalid_argument("Unknown metric '" + name + "'");
    }
    throw CapabilityUnsupportedError(name_, *capability);
}

SleepScoreSeries ComputeBackend::scoreSadeh(const std::vector<double>&, const std::string&) const {
    throw CapabilityUnsupportedError(name_, Capability::Sadeh);
}

SleepScoreSeries ComputeBackend::scoreColeKripke(const std::vector<double>&, const std::string&) const {
    throw CapabilityUnsupportedError(name_, Capability::ColeKripke);
}

SleepScoreSeries ComputeBackend::detectSustainedInactivity(const RawSampleSet&, const SibConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::VanHeesSib);
}

HdczaResult ComputeBackend::detectSleepWindow(const RawSampleSet&, const HdczaConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::Hdcza);
}

SleepPeriodMetrics ComputeBackend::sleepPeriodMetrics(const std::vector<int>&,
                                                      const std::vector<double>&,
                                                      std::size_t,
                                                      std::size_t,
                                                      double) const {
    throw CapabilityUnsupportedError(name_, Capability::SleepPeriodMetrics);
}

std::optional<SleepPeriod> ComputeBackend::detectSleepPeriod(const std::vector<int>&,
                                                             const std::vector<double>&,
                                                             double,
                                                             double,
                                                             const ConsecutiveEpochsConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::SleepPeriodDetection);
}

NonwearSeries ComputeBackend::detectNonwearVanHees(const RawSampleSet&, const VanHeesNonwearConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::VanHeesNonwear);
}

NonwearSeries ComputeBackend::detectNonwearChoi(const std::vector<double>&, const ChoiConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::ChoiNonwear);
}

NonwearSeries ComputeBackend::detectNonwearCapsense(const RawSampleSet&, const CapsenseConfig&) const {
    throw CapabilityUnsupportedError(name_, Capability::CapsenseNonwear);
}

NonwearOverlap ComputeBackend::correlateSleepWithNonwear(const SleepWindow&,
                                                         const NonwearSeries&,
                                                         const std::vector<double>&) const {
    throw CapabilityUnsupportedError(name_, Capability::NonwearOverlap);
}

CircadianMetrics ComputeBackend::computeM5L5(const std::vector<double>&,
                                             const std::vector<double>&,
                                             const M5L5Config&) const {
    throw CapabilityUnsupportedError(name_, Capability::M5L5);
}

CircadianMetrics ComputeBackend::computeInterdailyStability(const std::vector<double>&,
                                                            const std::vector<double>&) const {
    throw CapabilityUnsupportedError(name_, Capability::Ivis);
}

CircadianMetrics ComputeBackend::computeSleepRegularity(const std::vector<int>&, double) const {
    throw CapabilityUnsupportedError(name_, Capability::Sri);
}

AgreementMetric ComputeBackend::cohensKappa(const std::vector<int>&, const std::vector<int>&) const {
    throw CapabilityUnsupportedError(name_, Capability::CohensKappa);
}

}  // namespace acti
