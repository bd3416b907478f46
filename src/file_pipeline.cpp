#include "file_pipeline.hpp"

#include "circadian.hpp"
#include "errors.hpp"
#include "math_utils.hpp"
#include "nonwear.hpp"
#include "sleep_scoring.hpp"
#include "sustained_inactivity.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace acti {

namespace {

constexpr double kCountEpochSeconds = 60.0;
constexpr double kSibEpochSeconds = 5.0;
// Sadeh and Cole-Kripke were fitted to the vertical (y) axis counts.
constexpr EpochAxis kCountScoringAxis = EpochAxis::Y;

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::unique_ptr<ComputeBackend> makeBackend(const PipelineConfig& config, const BackendRegistry& registry) {
    if (config.backendId.empty()) {
        return registry.create();
    }
    return registry.create(config.backendId);
}

}  // namespace

void validatePipelineConfig(const PipelineConfig& config) {
    if (!(config.epochLengthSeconds > 0.0) || !std::isfinite(config.epochLengthSeconds)) {
        throw std::invalid_argument("Epoch length must be a positive number of seconds");
    }
    const std::string& sleep = config.sleepAlgorithm;
    if (sleep == "sadeh") {
        sadehVariant(config.variant);
    } else if (sleep == "cole_kripke") {
        coleKripkeVariant(config.variant);
    } else if (sleep == "sib") {
        double ratio = config.epochLengthSeconds / kSibEpochSeconds;
        if (std::fabs(ratio - std::round(ratio)) > 1e-9) {
            throw std::invalid_argument("sib scoring needs an epoch length that is a multiple of 5 s");
        }
    } else if (sleep != "none") {
        throw std::invalid_argument("Unknown sleep algorithm '" + sleep + "'");
    }

    const std::string& nonwear = config.nonwearAlgorithm;
    if (nonwear != "choi" && nonwear != "capsense" && nonwear != "none" &&
        !contains(vanHeesParameterSetNames(), nonwear)) {
        throw std::invalid_argument("Unknown nonwear algorithm '" + nonwear + "'");
    }
}

FilePipeline::FilePipeline(PipelineConfig config)
    : FilePipeline(std::move(config), defaultRegistry()) {}

FilePipeline::FilePipeline(PipelineConfig config, const BackendRegistry& registry)
    : config_(std::move(config)) {
    validatePipelineConfig(config_);
    backend_ = makeBackend(config_, registry);
}

FileReport FilePipeline::run(const std::string& path) const {
    FileReport report;
    report.path = path;
    report.backend = backend_->name();

    auto start = std::chrono::steady_clock::now();
    try {
        process(path, report);
    } catch (const std::exception& ex) {
        report.error = ex.what();
    }
    report.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return report;
}

void FilePipeline::process(const std::string& path, FileReport& report) const {
    report.metadata = backend_->readGt3xMetadata(path);
    if (config_.metadataOnly) {
        return;
    }

    Gt3xReadOptions options;
    options.includeAuxiliary = config_.includeAuxiliary || config_.nonwearAlgorithm == "capsense";
    RawSampleSet raw = backend_->readGt3x(path, options);
    report.sampleCount = raw.size();

    if (config_.calibrate) {
        if (backend_->supports(Capability::Calibration)) {
            CalibrationOutcome outcome = backend_->calibrate(raw, config_.calibration);
            if (outcome.success) {
                raw = backend_->applyCalibration(raw, outcome);
            } else {
                report.warnings.push_back("calibration skipped: " + outcome.message);
            }
            report.calibration = outcome;
        } else {
            report.warnings.push_back("calibration skipped: backend '" + backend_->name() +
                                      "' does not support calibration");
        }
    }

    if (config_.impute) {
        ImputationOutcome imputed = backend_->imputeGaps(raw, config_.imputation);
        report.gapCount = imputed.gapCount;
        report.samplesAdded = imputed.samplesAdded;
        report.totalGapSeconds = imputed.totalGapSeconds;
        report.zerosReplaced = imputed.zerosReplaced;
        if (imputed.gapCount > 0 || imputed.zerosReplaced > 0) {
            raw = withImputation(raw, imputed);
        }
    }

    EpochSet epochs = backend_->aggregateEpochs(raw, config_.epochLengthSeconds);
    report.epochs = epochs.vectorMagnitude;

    MetricSeries enmo = backend_->computeMetric("enmo", raw, FilterConfig{});
    report.meanEnmo = mean(enmo.values);

    scoreSleep(raw, epochs, report);
    std::vector<double> nonwearTimes = detectNonwear(raw, epochs.vectorMagnitude, report);

    if (config_.detectSleepWindow) {
        try {
            HdczaResult window = backend_->detectSleepWindow(raw, config_.hdcza);
            report.sleepWindows = window.windows;
        } catch (const InsufficientDataError& ex) {
            report.warnings.push_back(std::string("sleep window skipped: ") + ex.what());
        }
        if (report.nonwear) {
            for (const SleepWindow& w : report.sleepWindows) {
                report.sleepNonwearOverlap.push_back(
                    backend_->correlateSleepWithNonwear(w, *report.nonwear, nonwearTimes));
            }
        }
    }

    computeCircadian(epochs.vectorMagnitude, report);
}

void FilePipeline::scoreSleep(const RawSampleSet& raw, const EpochSet& epochs, FileReport& report) const {
    const std::string& algorithm = config_.sleepAlgorithm;
    if (algorithm == "none") {
        return;
    }
    if (algorithm == "sib") {
        SibConfig sib;
        sib.epochLengthSeconds = kSibEpochSeconds;
        SleepScoreSeries scores = backend_->detectSustainedInactivity(raw, sib);
        if (config_.epochLengthSeconds > kSibEpochSeconds) {
            scores.scores = resampleScores(scores.scores, kSibEpochSeconds, config_.epochLengthSeconds);
            scores.confidence.reset();
            scores.parameters["resampled_epoch_seconds"] = config_.epochLengthSeconds;
        }
        // One score per aggregated epoch.
        std::size_t epochCount = epochs.vectorMagnitude.size();
        if (scores.scores.size() > epochCount) {
            scores.scores.resize(epochCount);
            if (scores.confidence) {
                scores.confidence->resize(epochCount);
            }
        }
        report.scores = std::move(scores);
        return;
    }

    if (std::fabs(config_.epochLengthSeconds - kCountEpochSeconds) > 1e-9) {
        report.warnings.push_back(algorithm + " is defined on 60 s epochs; scoring " +
                                  std::to_string(static_cast<int>(config_.epochLengthSeconds)) + " s epochs");
    }
    const EpochSummary& counts = epochs.select(kCountScoringAxis);
    if (algorithm == "sadeh") {
        report.scores = backend_->scoreSadeh(counts.counts, config_.variant);
    } else {
        report.scores = backend_->scoreColeKripke(counts.counts, config_.variant);
    }
}

std::vector<double> FilePipeline::detectNonwear(const RawSampleSet& raw,
                                                const EpochSummary& epochs,
                                                FileReport& report) const {
    const std::string& algorithm = config_.nonwearAlgorithm;
    if (algorithm == "none") {
        return {};
    }
    if (algorithm == "choi") {
        if (std::fabs(epochs.epochLengthSeconds - kCountEpochSeconds) < 1e-9) {
            report.nonwear = backend_->detectNonwearChoi(epochs.counts, ChoiConfig{});
            return epochs.timestamps;
        }
        EpochSet minuteEpochs = backend_->aggregateEpochs(raw, kCountEpochSeconds);
        report.nonwear = backend_->detectNonwearChoi(minuteEpochs.vectorMagnitude.counts, ChoiConfig{});
        return minuteEpochs.vectorMagnitude.timestamps;
    }
    if (algorithm == "capsense") {
        if (!raw.capsense) {
            report.warnings.push_back("nonwear skipped: file has no capsense records");
            return {};
        }
        report.nonwear = backend_->detectNonwearCapsense(raw, CapsenseConfig{});
        return raw.capsense->timestamps;
    }
    report.nonwear = backend_->detectNonwearVanHees(raw, vanHeesParameterSet(algorithm));
    return raw.timestamps;
}

void FilePipeline::computeCircadian(const EpochSummary& epochs, FileReport& report) const {
    if (epochs.size() < 2) {
        report.warnings.push_back("circadian metrics skipped: fewer than two epochs");
        return;
    }
    try {
        report.circadian.push_back(backend_->computeM5L5(epochs.counts, epochs.timestamps, M5L5Config{}));
    } catch (const InsufficientDataError& ex) {
        report.warnings.push_back(std::string("m5l5 skipped: ") + ex.what());
    }
    try {
        report.circadian.push_back(backend_->computeInterdailyStability(epochs.counts, epochs.timestamps));
    } catch (const InsufficientDataError& ex) {
        report.warnings.push_back(std::string("ivis skipped: ") + ex.what());
    }
    if (report.scores) {
        try {
            report.circadian.push_back(
                backend_->computeSleepRegularity(report.scores->scores, config_.epochLengthSeconds));
        } catch (const InsufficientDataError& ex) {
            report.warnings.push_back(std::string("sri skipped: ") + ex.what());
        }
    }
}

}  // namespace acti
