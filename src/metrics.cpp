#include "metrics.hpp"

#include "filters.hpp"
#include "parallel.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

namespace acti {

namespace {

using AxisFilter = std::function<std::vector<double>(const std::vector<double>&)>;

struct Triad {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> z;
};

void requireSameLength(const std::vector<double>& x, const std::vector<double>& y, const std::vector<double>& z) {
    if (x.size() != y.size() || x.size() != z.size()) {
        throw std::invalid_argument("Axis arrays differ in length");
    }
}

Triad filterTriad(const std::vector<double>& x,
                  const std::vector<double>& y,
                  const std::vector<double>& z,
                  const AxisFilter& filter,
                  Execution execution) {
    Triad out;
    if (execution == Execution::Parallel) {
        runConcurrently([&]() { out.x = filter(x); },
                        [&]() { out.y = filter(y); },
                        [&]() { out.z = filter(z); });
    } else {
        out.x = filter(x);
        out.y = filter(y);
        out.z = filter(z);
    }
    return out;
}

std::size_t workersFor(Execution execution) {
    return execution == Execution::Parallel ? hardwareWorkers() : 1;
}

std::vector<double> euclideanNorm(const Triad& t, double shift, bool clampNegative, Execution execution) {
    std::vector<double> out(t.x.size());
    parallelFor(out.size(), workersFor(execution), [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            double v = norm(t.x[i], t.y[i], t.z[i]) - shift;
            out[i] = clampNegative && v < 0.0 ? 0.0 : v;
        }
    });
    return out;
}

}  // namespace

double inclinationAngle(double x, double y, double z, AngleAxis axis) {
    switch (axis) {
        case AngleAxis::X:
            return std::atan2(x, std::sqrt(y * y + z * z)) * kRadToDeg;
        case AngleAxis::Y:
            return std::atan2(y, std::sqrt(x * x + z * z)) * kRadToDeg;
        case AngleAxis::Z:
            return std::atan2(z, std::sqrt(x * x + y * y)) * kRadToDeg;
    }
    return quietNaN();
}

std::vector<double> computeEnmo(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z,
                                Execution execution) {
    requireSameLength(x, y, z);
    std::vector<double> out(x.size());
    parallelFor(out.size(), workersFor(execution), [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            out[i] = enmo(x[i], y[i], z[i]);
        }
    });
    return out;
}

std::vector<double> computeAngle(const std::vector<double>& x,
                                 const std::vector<double>& y,
                                 const std::vector<double>& z,
                                 AngleAxis axis,
                                 Execution execution) {
    requireSameLength(x, y, z);
    std::vector<double> out(x.size());
    parallelFor(out.size(), workersFor(execution), [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            out[i] = inclinationAngle(x[i], y[i], z[i], axis);
        }
    });
    return out;
}

double effectiveHighCutoff(double sampleRate, const FilterConfig& config) {
    if (sampleRate <= 2.0 * config.highCutoffHz) {
        return std::round(sampleRate / 2.0) - 1.0;
    }
    return config.highCutoffHz;
}

std::vector<double> computeLfenmo(const std::vector<double>& x,
                                  const std::vector<double>& y,
                                  const std::vector<double>& z,
                                  double sampleRate,
                                  const FilterConfig& config,
                                  Execution execution) {
    requireSameLength(x, y, z);
    double high = effectiveHighCutoff(sampleRate, config);
    Triad filtered = filterTriad(x, y, z, [&](const std::vector<double>& axis) {
        return lowPass(axis, sampleRate, high, config.order);
    }, execution);
    return euclideanNorm(filtered, 1.0, true, execution);
}

std::vector<double> computeHfen(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z,
                                double sampleRate,
                                const FilterConfig& config,
                                Execution execution) {
    requireSameLength(x, y, z);
    Triad filtered = filterTriad(x, y, z, [&](const std::vector<double>& axis) {
        return highPass(axis, sampleRate, config.lowCutoffHz, config.order);
    }, execution);
    return euclideanNorm(filtered, 0.0, false, execution);
}

std::vector<double> computeBfen(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z,
                                double sampleRate,
                                const FilterConfig& config,
                                Execution execution) {
    requireSameLength(x, y, z);
    double high = effectiveHighCutoff(sampleRate, config);
    Triad filtered = filterTriad(x, y, z, [&](const std::vector<double>& axis) {
        return bandPass(axis, sampleRate, config.lowCutoffHz, high, config.order);
    }, execution);
    return euclideanNorm(filtered, 0.0, false, execution);
}

std::vector<double> computeHfenPlus(const std::vector<double>& x,
                                    const std::vector<double>& y,
                                    const std::vector<double>& z,
                                    double sampleRate,
                                    const FilterConfig& config,
                                    Execution execution) {
    requireSameLength(x, y, z);
    std::vector<double> hfen = computeHfen(x, y, z, sampleRate, config, execution);
    Triad low = filterTriad(x, y, z, [&](const std::vector<double>& axis) {
        return lowPass(axis, sampleRate, config.lowCutoffHz, config.order);
    }, execution);
    std::vector<double> lowNorm = euclideanNorm(low, 1.0, false, execution);
    for (std::size_t i = 0; i < hfen.size(); ++i) {
        hfen[i] = std::max(0.0, hfen[i] + lowNorm[i]);
    }
    return hfen;
}

std::vector<std::string> metricNames() {
    return {"enmo", "anglex", "angley", "anglez", "lfenmo", "hfen", "bfen", "hfenplus"};
}

bool isFilteredMetric(const std::string& name) {
    return name == "lfenmo" || name == "hfen" || name == "bfen" || name == "hfenplus";
}

MetricSeries computeMetric(const std::string& name,
                           const RawSampleSet& raw,
                           const FilterConfig& config,
                           Execution execution) {
    if (!raw.isConsistent()) {
        throw std::invalid_argument("Axis and timestamp arrays differ in length");
    }

    MetricSeries series;
    series.name = name;
    series.timestamps = raw.timestamps;
    series.parameters["sample_rate"] = raw.sampleRate;

    if (name == "enmo") {
        series.values = computeEnmo(raw.x, raw.y, raw.z, execution);
    } else if (name == "anglex") {
        series.values = computeAngle(raw.x, raw.y, raw.z, AngleAxis::X, execution);
    } else if (name == "angley") {
        series.values = computeAngle(raw.x, raw.y, raw.z, AngleAxis::Y, execution);
    } else if (name == "anglez") {
        series.values = computeAngle(raw.x, raw.y, raw.z, AngleAxis::Z, execution);
    } else if (isFilteredMetric(name)) {
        series.parameters["low_cutoff_hz"] = config.lowCutoffHz;
        series.parameters["high_cutoff_hz"] = effectiveHighCutoff(raw.sampleRate, config);
        series.parameters["order"] = static_cast<double>(config.order);
        if (name == "lfenmo") {
            series.values = computeLfenmo(raw.x, raw.y, raw.z, raw.sampleRate, config, execution);
        } else if (name == "hfen") {
            series.values = computeHfen(raw.x, raw.y, raw.z, raw.sampleRate, config, execution);
        } else if (name == "bfen") {
            series.values = computeBfen(raw.x, raw.y, raw.z, raw.sampleRate, config, execution);
        } else {
            series.values = computeHfenPlus(raw.x, raw.y, raw.z, raw.sampleRate, config, execution);
        }
    } else {
        throw std::invalid_argument("Unknown metric '" + name + "'");
    }
    return series;
}

}  // namespace acti
