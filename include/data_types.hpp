#pragma once

#include "math_utils.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace acti {

// Numeric parameters recorded for reproducibility of a result.
using ParameterRecord = std::map<std::string, double>;

struct DeviceMetadata {
    std::string serialNumber;
    std::string deviceType;
    std::string firmware;
    double sampleRate{0.0};                     // Hz
    double startTime{0.0};                      // seconds, device local clock
    std::optional<double> stopTime;
    std::optional<double> lastSampleTime;
    std::optional<double> downloadTime;
    std::optional<double> timezoneOffsetSeconds;
    double accelerationScale{0.0};              // counts per g
    std::optional<double> accelerationMin;      // g
    std::optional<double> accelerationMax;      // g
    std::map<std::string, std::string> raw;     // every key of the metadata text
};

struct AuxiliaryChannel {
    std::vector<double> timestamps;
    std::vector<double> values;
};

struct CapsenseChannel {
    std::vector<double> timestamps;
    std::vector<std::uint16_t> signal;
    std::vector<std::uint16_t> reference;
    std::vector<std::uint8_t> state;   // 1 = skin contact
    std::vector<std::uint8_t> bursts;
};

struct RawSampleSet {
    std::vector<double> x;           // g
    std::vector<double> y;
    std::vector<double> z;
    std::vector<double> timestamps;  // seconds
    double sampleRate{0.0};          // Hz

    std::optional<DeviceMetadata> metadata;
    std::optional<AuxiliaryChannel> light;    // lux
    std::optional<AuxiliaryChannel> battery;  // volts
    std::optional<CapsenseChannel> capsense;

    std::size_t size() const { return timestamps.size(); }
    bool empty() const { return timestamps.empty(); }
    bool isConsistent() const {
        return x.size() == timestamps.size() && y.size() == timestamps.size() && z.size() == timestamps.size();
    }
};

struct CalibrationFeature {
    double normMean{0.0};
    Vec3 mean;
    Vec3 sd;
};

struct CalibrationOutcome {
    bool success{false};
    Vec3 scale{1.0, 1.0, 1.0};
    Vec3 offset{0.0, 0.0, 0.0};
    double errorBefore{quietNaN()};
    double errorAfter{quietNaN()};
    std::size_t pointCount{0};
    std::string message;
};

struct GapDetail {
    std::size_t index{0};           // sample preceding the gap
    double startTime{0.0};
    double durationSeconds{0.0};
    std::size_t samplesInserted{0};
    bool normalized{false};
};

struct ImputationOutcome {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> z;
    std::vector<double> timestamps;
    std::size_t gapCount{0};
    std::size_t samplesAdded{0};   // relative to the series after zero handling
    double totalGapSeconds{0.0};
    std::size_t zerosReplaced{0};  // all-zero rows found before gap filling
    std::vector<GapDetail> gaps;
};

enum class EpochAxis {
    X,
    Y,
    Z,
    VectorMagnitude
};

std::string epochAxisName(EpochAxis axis);

struct EpochSummary {
    std::vector<double> counts;
    std::vector<double> timestamps;
    double epochLengthSeconds{0.0};
    EpochAxis axis{EpochAxis::VectorMagnitude};

    std::size_t size() const { return counts.size(); }
};

struct EpochSet {
    EpochSummary x;
    EpochSummary y;
    EpochSummary z;
    EpochSummary vectorMagnitude;
    std::size_t samplesPerEpoch{0};

    const EpochSummary& select(EpochAxis axis) const;
};

struct MetricSeries {
    std::string name;
    std::vector<double> values;
    std::optional<std::vector<double>> timestamps;
    ParameterRecord parameters;
};

struct SleepScoreSeries {
    std::vector<int> scores;  // 1 = sleep, 0 = wake
    std::string algorithm;
    std::optional<std::vector<double>> confidence;
    ParameterRecord parameters;
};

struct SleepWindow {
    std::size_t onsetIndex{0};
    std::size_t offsetIndex{0};
    double onsetTime{0.0};
    double offsetTime{0.0};
    double totalSleepMinutes{0.0};
    double wakeAfterOnsetMinutes{0.0};
    double efficiencyPercent{0.0};
    std::string method;
};

struct NonwearRange {
    std::size_t start{0};  // inclusive
    std::size_t end{0};    // inclusive
};

struct NonwearSeries {
    std::vector<bool> nonwear;
    std::vector<NonwearRange> ranges;
    std::string algorithm;
    ParameterRecord parameters;
};

struct CircadianMetrics {
    std::string name;
    std::map<std::string, double> values;
};

struct AgreementMetric {
    std::string name;
    double value{0.0};
    double observedAgreement{0.0};
    double expectedAgreement{0.0};
    std::map<std::string, double> statistics;
};

// Contiguous true runs of a flag vector as inclusive index ranges.
std::vector<NonwearRange> contiguousRanges(const std::vector<bool>& flags);

}  // namespace acti
