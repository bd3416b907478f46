#pragma once

#include "data_types.hpp"

#include <string>
#include <vector>

namespace acti {

struct CalibrationConfig {
    double windowSeconds{10.0};
    double sphereCriterion{0.3};     // g, required spread on each axis
    double sdCriterion{0.013};       // g, stationary threshold
    std::size_t minimumPoints{10};
    std::size_t maxIterations{200};
    double tolerance{1.49e-8};       // relative cost and step tolerance
};

// Sentinel written by upstream tools for windows with no valid data.
constexpr double kInvalidFeatureSentinel = 99999.0;

// Column-major table with named columns, e.g. a CSV export.
struct SampleTable {
    std::vector<std::string> columns;
    std::vector<std::vector<double>> data;
};

std::size_t calibrationWindowLength(double sampleRate, double windowSeconds);

CalibrationFeature computeWindowFeature(const RawSampleSet& raw, std::size_t start, std::size_t length);

std::vector<CalibrationFeature> extractCalibrationFeatures(const RawSampleSet& raw,
                                                           const CalibrationConfig& config = {});

// Fits offset/scale on the stationary windows. Precondition failures are
// reported through CalibrationOutcome::success, never thrown.
CalibrationOutcome calibrate(const std::vector<CalibrationFeature>& features,
                             const CalibrationConfig& config = {});

CalibrationOutcome autoCalibrate(const RawSampleSet& raw, const CalibrationConfig& config = {});

struct CalibratedAxes {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> z;
};

CalibratedAxes applyCalibration(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z,
                                const Vec3& scale,
                                const Vec3& offset);

RawSampleSet applyCalibration(const RawSampleSet& raw, const CalibrationOutcome& outcome);

// Axis columns are located by name; throws std::invalid_argument when absent.
SampleTable applyCalibration(const SampleTable& table, const Vec3& scale, const Vec3& offset);

}  // namespace acti
