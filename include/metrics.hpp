#pragma once

#include "data_types.hpp"

#include <string>
#include <vector>

namespace acti {

enum class AngleAxis {
    X,
    Y,
    Z
};

enum class Execution {
    Sequential,
    Parallel
};

struct FilterConfig {
    double lowCutoffHz{0.2};
    double highCutoffHz{15.0};
    int order{4};
};

inline double enmo(double x, double y, double z) {
    double v = norm(x, y, z) - 1.0;
    return v > 0.0 ? v : 0.0;
}

// Inclination of the given axis against the plane of the other two, degrees.
double inclinationAngle(double x, double y, double z, AngleAxis axis);

std::vector<double> computeEnmo(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z,
                                Execution execution = Execution::Sequential);

std::vector<double> computeAngle(const std::vector<double>& x,
                                 const std::vector<double>& y,
                                 const std::vector<double>& z,
                                 AngleAxis axis,
                                 Execution execution = Execution::Sequential);

// High cutoff actually used at this sample rate (lowered below Nyquist when needed).
double effectiveHighCutoff(double sampleRate, const FilterConfig& config);

std::vector<double> computeLfenmo(const std::vector<double>& x,
                                  const std::vector<double>& y,
                                  const std::vector<double>& z,
                                  double sampleRate,
                                  const FilterConfig& config = {},
                                  Execution execution = Execution::Sequential);

std::vector<double> computeHfen(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z,
                                double sampleRate,
                                const FilterConfig& config = {},
                                Execution execution = Execution::Sequential);

std::vector<double> computeBfen(const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::vector<double>& z,
                                double sampleRate,
                                const FilterConfig& config = {},
                                Execution execution = Execution::Sequential);

std::vector<double> computeHfenPlus(const std::vector<double>& x,
                                    const std::vector<double>& y,
                                    const std::vector<double>& z,
                                    double sampleRate,
                                    const FilterConfig& config = {},
                                    Execution execution = Execution::Sequential);

// enmo, anglex, angley, anglez, lfenmo, hfen, bfen, hfenplus
std::vector<std::string> metricNames();
bool isFilteredMetric(const std::string& name);

// Dispatches a metric by name. Unknown names throw std::invalid_argument.
MetricSeries computeMetric(const std::string& name,
                           const RawSampleSet& raw,
                           const FilterConfig& config = {},
                           Execution execution = Execution::Sequential);

}  // namespace acti
