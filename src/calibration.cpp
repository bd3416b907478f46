#include "calibration.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace acti {

namespace {

using Params = std::array<double, 6>;  // offset x,y,z then scale x,y,z
using Matrix6 = std::array<std::array<double, 6>, 6>;

Vec3 offsetOf(const Params& p) {
    return Vec3{p[0], p[1], p[2]};
}

Vec3 scaleOf(const Params& p) {
    return Vec3{p[3], p[4], p[5]};
}

double residual(const Vec3& mean, const Params& p) {
    return norm(hadamard(mean + offsetOf(p), scaleOf(p))) - 1.0;
}

double cost(const std::vector<Vec3>& points, const Params& p) {
    double sum = 0.0;
    for (const auto& m : points) {
        double r = residual(m, p);
        sum += r * r;
    }
    return sum;
}

// Gaussian elimination with partial pivoting.
bool solveLinearSystem(Matrix6 a, std::array<double, 6> b, std::array<double, 6>& x) {
    const std::size_t n = 6;
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t pivot = i;
        double maxVal = std::fabs(a[i][i]);
        for (std::size_t r = i + 1; r < n; ++r) {
            if (std::fabs(a[r][i]) > maxVal) {
                maxVal = std::fabs(a[r][i]);
                pivot = r;
            }
        }
        if (maxVal < 1e-15) {
            return false;
        }
        if (pivot != i) {
            std::swap(a[i], a[pivot]);
            std::swap(b[i], b[pivot]);
        }
        for (std::size_t r = i + 1; r < n; ++r) {
            double factor = a[r][i] / a[i][i];
            for (std::size_t c = i; c < n; ++c) {
                a[r][c] -= factor * a[i][c];
            }
            b[r] -= factor * b[i];
        }
    }
    for (std::size_t i = n; i-- > 0;) {
        double sum = b[i];
        for (std::size_t c = i + 1; c < n; ++c) {
            sum -= a[i][c] * x[c];
        }
        x[i] = sum / a[i][i];
    }
    return true;
}

// Levenberg-Marquardt on the unit-sphere residuals.
Params fitSphere(const std::vector<Vec3>& points, const CalibrationConfig& config) {
    Params p{0.0, 0.0, 0.0, 1.0, 1.0, 1.0};
    double lambda = 1e-3;
    double currentCost = cost(points, p);

    for (std::size_t iter = 0; iter < config.maxIterations; ++iter) {
        Matrix6 jtj{};
        std::array<double, 6> jtr{};
        for (const auto& m : points) {
            Vec3 shifted = m + offsetOf(p);
            Vec3 v = hadamard(shifted, scaleOf(p));
            double n = norm(v);
            if (n < 1e-12) {
                continue;
            }
            double r = n - 1.0;
            std::array<double, 6> row{
                p[3] * v.x / n, p[4] * v.y / n, p[5] * v.z / n,
                shifted.x * v.x / n, shifted.y * v.y / n, shifted.z * v.z / n};
            for (std::size_t c = 0; c < 6; ++c) {
                jtr[c] += row[c] * r;
                for (std::size_t k = 0; k < 6; ++k) {
                    jtj[c][k] += row[c] * row[k];
                }
            }
        }

        bool improved = false;
        while (!improved) {
            Matrix6 damped = jtj;
            for (std::size_t d = 0; d < 6; ++d) {
                damped[d][d] += lambda * std::max(jtj[d][d], 1e-12);
            }
            std::array<double, 6> rhs{};
            for (std::size_t d = 0; d < 6; ++d) {
                rhs[d] = -jtr[d];
            }
            std::array<double, 6> delta{};
            if (!solveLinearSystem(damped, rhs, delta)) {
                return p;
            }

            Params candidate = p;
            double stepNorm = 0.0;
            double paramNorm = 0.0;
            for (std::size_t d = 0; d < 6; ++d) {
                candidate[d] += delta[d];
                stepNorm += delta[d] * delta[d];
                paramNorm += p[d] * p[d];
            }
            stepNorm = std::sqrt(stepNorm);
            paramNorm = std::sqrt(paramNorm);

            double candidateCost = cost(points, candidate);
            if (std::isfinite(candidateCost) && candidateCost < currentCost) {
                double reduction = (currentCost - candidateCost) / std::max(currentCost, 1e-300);
                p = candidate;
                currentCost = candidateCost;
                lambda = std::max(lambda / 10.0, 1e-12);
                improved = true;
                if (reduction <= config.tolerance ||
                    stepNorm <= config.tolerance * (paramNorm + config.tolerance)) {
                    return p;
                }
            } else {
                lambda *= 10.0;
                if (lambda > 1e12) {
                    return p;
                }
            }
        }
    }
    return p;
}

double meanAbsoluteError(const std::vector<Vec3>& points, const Vec3& scale, const Vec3& offset) {
    double sum = 0.0;
    for (const auto& m : points) {
        sum += std::fabs(norm(hadamard(m + offset, scale)) - 1.0);
    }
    return roundTo(sum / static_cast<double>(points.size()), 5);
}

CalibrationOutcome failure(const std::string& message, std::size_t points) {
    CalibrationOutcome outcome;
    outcome.success = false;
    outcome.pointCount = points;
    outcome.message = message;
    return outcome;
}

int findColumn(const SampleTable& table, const std::string& name) {
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (table.columns[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}  // namespace

std::size_t calibrationWindowLength(double sampleRate, double windowSeconds) {
    if (sampleRate <= 0.0 || windowSeconds <= 0.0) {
        throw std::invalid_argument("Sample rate and window length must be positive");
    }
    return static_cast<std::size_t>(sampleRate * windowSeconds);
}

CalibrationFeature computeWindowFeature(const RawSampleSet& raw, std::size_t start, std::size_t length) {
    CalibrationFeature feature;
    auto first = static_cast<std::ptrdiff_t>(start);
    auto last = static_cast<std::ptrdiff_t>(start + length);

    double normSum = 0.0;
    for (std::size_t i = start; i < start + length; ++i) {
        normSum += norm(raw.x[i], raw.y[i], raw.z[i]);
    }
    feature.normMean = normSum / static_cast<double>(length);
    feature.mean = Vec3{mean(raw.x.begin() + first, raw.x.begin() + last),
                        mean(raw.y.begin() + first, raw.y.begin() + last),
                        mean(raw.z.begin() + first, raw.z.begin() + last)};
    feature.sd = Vec3{sampleStdDev(raw.x.begin() + first, raw.x.begin() + last),
                      sampleStdDev(raw.y.begin() + first, raw.y.begin() + last),
                      sampleStdDev(raw.z.begin() + first, raw.z.begin() + last)};
    return feature;
}

std::vector<CalibrationFeature> extractCalibrationFeatures(const RawSampleSet& raw,
                                                           const CalibrationConfig& config) {
    if (!raw.isConsistent()) {
        throw std::invalid_argument("Axis and timestamp arrays differ in length");
    }
    std::size_t window = calibrationWindowLength(raw.sampleRate, config.windowSeconds);
    std::vector<CalibrationFeature> features;
    if (window == 0) {
        return features;
    }
    std::size_t windows = raw.size() / window;
    features.reserve(windows);
    for (std::size_t w = 0; w < windows; ++w) {
        features.push_back(computeWindowFeature(raw, w * window, window));
    }
    return features;
}

CalibrationOutcome calibrate(const std::vector<CalibrationFeature>& features, const CalibrationConfig& config) {
    std::vector<CalibrationFeature> valid;
    valid.reserve(features.size());
    for (const auto& f : features) {
        if (std::isfinite(f.normMean) && f.normMean != kInvalidFeatureSentinel) {
            valid.push_back(f);
        }
    }

    // The first window is dropped, as are exact repeats of the previous window.
    std::vector<CalibrationFeature> distinct;
    for (std::size_t i = 1; i < valid.size(); ++i) {
        const Vec3& m = valid[i].mean;
        const Vec3& prev = valid[i - 1].mean;
        if (i > 1 && m.x == prev.x && m.y == prev.y && m.z == prev.z) {
            continue;
        }
        distinct.push_back(valid[i]);
    }

    std::vector<Vec3> stationary;
    for (const auto& f : distinct) {
        bool still = f.sd.x < config.sdCriterion && f.sd.y < config.sdCriterion && f.sd.z < config.sdCriterion;
        bool inRange = std::fabs(f.mean.x) < 2.0 && std::fabs(f.mean.y) < 2.0 && std::fabs(f.mean.z) < 2.0;
        if (still && inRange) {
            stationary.push_back(f.mean);
        }
    }

    if (stationary.size() < config.minimumPoints) {
        return failure("not enough stationary points", stationary.size());
    }

    int sidesCovered = 0;
    for (int axis = 0; axis < 3; ++axis) {
        double lo = std::numeric_limits<double>::infinity();
        double hi = -std::numeric_limits<double>::infinity();
        for (const auto& m : stationary) {
            double v = axis == 0 ? m.x : (axis == 1 ? m.y : m.z);
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        if (lo < -config.sphereCriterion && hi > config.sphereCriterion) {
            ++sidesCovered;
        }
    }
    if (sidesCovered < 3) {
        return failure("not enough points on all sides of sphere", stationary.size());
    }

    Params p = fitSphere(stationary, config);
    for (double v : p) {
        if (!std::isfinite(v)) {
            return failure("calibration did not converge", stationary.size());
        }
    }

    CalibrationOutcome outcome;
    outcome.success = true;
    outcome.offset = offsetOf(p);
    outcome.scale = scaleOf(p);
    outcome.errorBefore = meanAbsoluteError(stationary, Vec3{1.0, 1.0, 1.0}, Vec3{0.0, 0.0, 0.0});
    outcome.errorAfter = meanAbsoluteError(stationary, outcome.scale, outcome.offset);
    outcome.pointCount = stationary.size();
    outcome.message = "calibration successful";
    return outcome;
}

CalibrationOutcome autoCalibrate(const RawSampleSet& raw, const CalibrationConfig& config) {
    return calibrate(extractCalibrationFeatures(raw, config), config);
}

CalibratedAxes applyCalibration(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z,
                                const Vec3& scale,
                                const Vec3& offset) {
    if (x.size() != y.size() || x.size() != z.size()) {
        throw std::invalid_argument("Axis arrays differ in length");
    }
    CalibratedAxes out;
    out.x.resize(x.size());
    out.y.resize(y.size());
    out.z.resize(z.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        out.x[i] = (x[i] + offset.x) * scale.x;
        out.y[i] = (y[i] + offset.y) * scale.y;
        out.z[i] = (z[i] + offset.z) * scale.z;
    }
    return out;
}

RawSampleSet applyCalibration(const RawSampleSet& raw, const CalibrationOutcome& outcome) {
    RawSampleSet out = raw;
    auto axes = applyCalibration(raw.x, raw.y, raw.z, outcome.scale, outcome.offset);
    out.x = std::move(axes.x);
    out.y = std::move(axes.y);
    out.z = std::move(axes.z);
    return out;
}

SampleTable applyCalibration(const SampleTable& table, const Vec3& scale, const Vec3& offset) {
    static const std::array<std::array<const char*, 3>, 4> kAxisNames = {{
        {"X", "Y", "Z"},
        {"x", "y", "z"},
        {"Axis1", "Axis2", "Axis3"},
        {"axis1", "axis2", "axis3"},
    }};

    for (const auto& names : kAxisNames) {
        int cx = findColumn(table, names[0]);
        int cy = findColumn(table, names[1]);
        int cz = findColumn(table, names[2]);
        if (cx < 0 || cy < 0 || cz < 0) {
            continue;
        }
        if (table.data.size() != table.columns.size()) {
            throw std::invalid_argument("Table column count does not match its data");
        }
        SampleTable out = table;
        auto axes = applyCalibration(table.data[cx], table.data[cy], table.data[cz], scale, offset);
        out.data[cx] = std::move(axes.x);
        out.data[cy] = std::move(axes.y);
        out.data[cz] = std::move(axes.z);
        return out;
    }
    throw std::invalid_argument("Could not find x, y, z axis columns");
}

}  // namespace acti
