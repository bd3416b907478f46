#pragma once

#include "backend_registry.hpp"
#include "calibration.hpp"
#include "data_types.hpp"
#include "hdcza.hpp"
#include "imputation.hpp"
#include "nonwear_overlap.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace acti {

struct PipelineConfig {
    std::string backendId;                    // empty = registry default
    bool calibrate{true};
    bool impute{true};
    double epochLengthSeconds{60.0};
    std::string sleepAlgorithm{"sadeh"};      // sadeh | cole_kripke | sib | none
    std::string variant{"actilife"};
    std::string nonwearAlgorithm{"van_hees_2023"};  // van_hees_2023 | van_hees_2013 | choi | capsense | none
    bool detectSleepWindow{false};
    bool includeAuxiliary{false};
    bool metadataOnly{false};

    CalibrationConfig calibration;
    ImputationConfig imputation;
    HdczaConfig hdcza;
};

// Throws std::invalid_argument for unknown algorithm names or a bad epoch length.
void validatePipelineConfig(const PipelineConfig& config);

struct FileReport {
    std::string path;
    std::string backend;
    std::optional<DeviceMetadata> metadata;
    std::size_t sampleCount{0};

    std::optional<CalibrationOutcome> calibration;
    std::size_t gapCount{0};
    std::size_t samplesAdded{0};
    double totalGapSeconds{0.0};
    std::size_t zerosReplaced{0};

    std::optional<EpochSummary> epochs;  // vector magnitude
    double meanEnmo{0.0};
    std::optional<SleepScoreSeries> scores;
    std::optional<NonwearSeries> nonwear;
    std::vector<SleepWindow> sleepWindows;
    std::vector<NonwearOverlap> sleepNonwearOverlap;  // one per sleep window
    std::vector<CircadianMetrics> circadian;

    std::vector<std::string> warnings;
    std::string error;
    bool cancelled{false};
    double elapsedSeconds{0.0};

    bool ok() const { return error.empty() && !cancelled; }
};

// Read, calibrate, impute, aggregate and classify one .gt3x file. Owns its
// backend instance, so a pipeline must not be shared between threads.
class FilePipeline {
public:
    explicit FilePipeline(PipelineConfig config);
    FilePipeline(PipelineConfig config, const BackendRegistry& registry);

    // Failures of the file are captured in FileReport::error.
    FileReport run(const std::string& path) const;

    const PipelineConfig& config() const { return config_; }
    const ComputeBackend& backend() const { return *backend_; }

private:
    void process(const std::string& path, FileReport& report) const;
    void scoreSleep(const RawSampleSet& raw, const EpochSet& epochs, FileReport& report) const;
    // Returns one timestamp per unit of the nonwear series.
    std::vector<double> detectNonwear(const RawSampleSet& raw, const EpochSummary& epochs, FileReport& report) const;
    void computeCircadian(const EpochSummary& epochs, FileReport& report) const;

    PipelineConfig config_;
    std::unique_ptr<ComputeBackend> backend_;
};

}  // namespace acti
