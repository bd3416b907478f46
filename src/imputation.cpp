#include "imputation.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace acti {

namespace {

constexpr double kNormalizationTolerance = 0.005;  // g

bool isZeroRow(const RawSampleSet& raw, std::size_t i) {
    return raw.x[i] == 0.0 && raw.y[i] == 0.0 && raw.z[i] == 0.0;
}

// Returns the number of all-zero rows found in the input.
std::size_t cleanZeroRows(const RawSampleSet& raw, ImputationOutcome& out) {
    const std::size_t n = raw.size();
    std::size_t zeros = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (isZeroRow(raw, i)) {
            ++zeros;
        }
    }
    out.x.reserve(n);
    out.y.reserve(n);
    out.z.reserve(n);
    out.timestamps.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        bool zero = isZeroRow(raw, i);
        if (zero && i == 0) {
            out.x.push_back(0.0);
            out.y.push_back(0.0);
            out.z.push_back(1.0);
            out.timestamps.push_back(raw.timestamps[i]);
        } else if (zero && i + 1 == n) {
            out.x.push_back(out.x.back());
            out.y.push_back(out.y.back());
            out.z.push_back(out.z.back());
            out.timestamps.push_back(raw.timestamps[i]);
        } else if (!zero) {
            out.x.push_back(raw.x[i]);
            out.y.push_back(raw.y[i]);
            out.z.push_back(raw.z[i]);
            out.timestamps.push_back(raw.timestamps[i]);
        }
    }
    return zeros;
}

}  // namespace

ImputationOutcome imputeGaps(const RawSampleSet& raw, const ImputationConfig& config) {
    if (!raw.isConsistent()) {
        throw std::invalid_argument("Axis and timestamp arrays differ in length");
    }
    if (raw.sampleRate <= 0.0) {
        throw std::invalid_argument("Sample rate must be positive for imputation");
    }

    ImputationOutcome out;
    if (config.replaceZeroSamples) {
        out.zerosReplaced = cleanZeroRows(raw, out);
    } else {
        out.x = raw.x;
        out.y = raw.y;
        out.z = raw.z;
        out.timestamps = raw.timestamps;
    }

    const std::size_t n = out.timestamps.size();
    const double period = 1.0 / raw.sampleRate;
    const double threshold = period + config.gapToleranceSeconds;
    const auto maxRepeats = static_cast<std::size_t>(config.maxGapMinutes * 60.0 * raw.sampleRate);

    for (std::size_t i = 0; i + 1 < n; ++i) {
        double delta = out.timestamps[i + 1] - out.timestamps[i];
        if (delta > threshold) {
            GapDetail gap;
            gap.index = i;
            gap.startTime = out.timestamps[i];
            gap.durationSeconds = delta;
            auto repeats = static_cast<std::size_t>(std::llround(delta * raw.sampleRate));
            repeats = std::min(std::max<std::size_t>(repeats, 1), std::max<std::size_t>(maxRepeats, 1));
            gap.samplesInserted = repeats - 1;
            out.gaps.push_back(gap);
            out.totalGapSeconds += delta;
        }
    }
    out.gapCount = out.gaps.size();
    if (out.gapCount == 0) {
        return out;
    }

    std::vector<double> x = std::move(out.x);
    std::vector<double> y = std::move(out.y);
    std::vector<double> z = std::move(out.z);
    std::size_t added = 0;
    for (const auto& gap : out.gaps) {
        added += gap.samplesInserted;
    }
    out.x.clear();
    out.y.clear();
    out.z.clear();
    out.x.reserve(n + added);
    out.y.reserve(n + added);
    out.z.reserve(n + added);

    std::size_t gapIndex = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (gapIndex >= out.gaps.size() || out.gaps[gapIndex].index != i) {
            out.x.push_back(x[i]);
            out.y.push_back(y[i]);
            out.z.push_back(z[i]);
            continue;
        }
        GapDetail& gap = out.gaps[gapIndex++];
        double fx = x[i];
        double fy = y[i];
        double fz = z[i];
        double magnitude = norm(fx, fy, fz);
        if (config.normalizeReplicatedRows && magnitude > 0.0 &&
            std::fabs(magnitude - 1.0) > kNormalizationTolerance) {
            fx /= magnitude;
            fy /= magnitude;
            fz /= magnitude;
            gap.normalized = true;
        }
        // The sample itself plus its copies.
        for (std::size_t k = 0; k <= gap.samplesInserted; ++k) {
            out.x.push_back(fx);
            out.y.push_back(fy);
            out.z.push_back(fz);
        }
    }

    const double start = out.timestamps.front();
    out.timestamps.resize(out.x.size());
    for (std::size_t k = 0; k < out.timestamps.size(); ++k) {
        out.timestamps[k] = start + static_cast<double>(k) * period;
    }
    out.samplesAdded = out.x.size() - n;
    return out;
}

RawSampleSet withImputation(const RawSampleSet& raw, const ImputationOutcome& outcome) {
    RawSampleSet out = raw;
    out.x = outcome.x;
    out.y = outcome.y;
    out.z = outcome.z;
    out.timestamps = outcome.timestamps;
    return out;
}

}  // namespace acti
