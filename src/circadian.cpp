#include "circadian.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

namespace acti {

namespace {

constexpr double kSecondsPerDay = 86400.0;
constexpr double kSecondsPerHour = 3600.0;
constexpr int kHoursPerDay = 24;

void requireSameLength(const std::vector<double>& values, const std::vector<double>& timestamps) {
    if (values.size() != timestamps.size()) {
        throw std::invalid_argument("Values and timestamps differ in length");
    }
}

double secondOfDay(double timestamp) {
    double s = std::fmod(timestamp, kSecondsPerDay);
    return s < 0.0 ? s + kSecondsPerDay : s;
}

}  // namespace

double estimateEpochSeconds(const std::vector<double>& timestamps) {
    if (timestamps.size() < 2) {
        throw std::invalid_argument("At least two timestamps are needed to infer the epoch length");
    }
    std::vector<double> deltas;
    deltas.reserve(timestamps.size() - 1);
    for (std::size_t i = 1; i < timestamps.size(); ++i) {
        deltas.push_back(timestamps[i] - timestamps[i - 1]);
    }
    double epoch = median(deltas);
    if (!(epoch > 0.0)) {
        throw std::invalid_argument("Timestamps must increase");
    }
    return epoch;
}

CircadianMetrics computeM5L5(const std::vector<double>& values,
                             const std::vector<double>& timestamps,
                             const M5L5Config& config) {
    requireSameLength(values, timestamps);
    if (config.windowHours <= 0.0 || config.windowHours > kHoursPerDay) {
        throw std::invalid_argument("Window must be between 0 and 24 hours");
    }
    if (values.size() < 2) {
        throw InsufficientDataError("Not enough data for M5/L5");
    }
    const double epoch = estimateEpochSeconds(timestamps);
    if (static_cast<double>(values.size()) * epoch < config.windowHours * kSecondsPerHour) {
        throw InsufficientDataError("Less than " + std::to_string(config.windowHours) + " hours of data");
    }

    const auto bins = static_cast<std::size_t>(std::max(1.0, std::round(kSecondsPerDay / epoch)));
    std::vector<double> sum(bins, 0.0);
    std::vector<std::size_t> count(bins, 0);
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            continue;
        }
        auto bin = static_cast<std::size_t>(secondOfDay(timestamps[i]) / epoch + 1e-9) % bins;
        sum[bin] += values[i];
        ++count[bin];
    }

    const auto width = static_cast<std::size_t>(std::max(1.0, std::round(config.windowHours * kSecondsPerHour / epoch)));
    double best = -std::numeric_limits<double>::infinity();
    double worst = std::numeric_limits<double>::infinity();
    std::size_t bestStart = 0;
    std::size_t worstStart = 0;
    for (std::size_t s = 0; s < bins; ++s) {
        double total = 0.0;
        std::size_t used = 0;
        for (std::size_t k = 0; k < width; ++k) {
            std::size_t b = (s + k) % bins;
            if (count[b] > 0) {
                total += sum[b] / static_cast<double>(count[b]);
                ++used;
            }
        }
        if (used == 0) {
            continue;
        }
        double avg = total / static_cast<double>(used);
        if (avg > best) {
            best = avg;
            bestStart = s;
        }
        if (avg < worst) {
            worst = avg;
            worstStart = s;
        }
    }
    if (!std::isfinite(best) || !std::isfinite(worst)) {
        throw InsufficientDataError("No finite values for M5/L5");
    }

    CircadianMetrics out;
    out.name = "m5l5";
    out.values["m5"] = best;
    out.values["l5"] = worst;
    out.values["m5_start_hour"] = static_cast<double>(bestStart) * epoch / kSecondsPerHour;
    out.values["l5_start_hour"] = static_cast<double>(worstStart) * epoch / kSecondsPerHour;
    out.values["relative_amplitude"] = best + worst == 0.0 ? 0.0 : (best - worst) / (best + worst);
    out.values["window_hours"] = config.windowHours;
    return out;
}

CircadianMetrics computeInterdailyStability(const std::vector<double>& values, const std::vector<double>& timestamps) {
    requireSameLength(values, timestamps);

    std::map<long long, std::pair<double, std::size_t>> hourly;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            continue;
        }
        auto hour = static_cast<long long>(std::floor(timestamps[i] / kSecondsPerHour));
        auto& slot = hourly[hour];
        slot.first += values[i];
        ++slot.second;
    }
    if (hourly.size() < 2) {
        throw InsufficientDataError("At least two hours of data are needed for IS/IV");
    }

    std::vector<double> x;
    std::vector<int> hourOfDay;
    x.reserve(hourly.size());
    for (const auto& [hour, slot] : hourly) {
        x.push_back(slot.first / static_cast<double>(slot.second));
        long long h = hour % kHoursPerDay;
        hourOfDay.push_back(static_cast<int>(h < 0 ? h + kHoursPerDay : h));
    }

    const auto n = static_cast<double>(x.size());
    const double grand = mean(x);
    double total = 0.0;
    for (double v : x) {
        total += (v - grand) * (v - grand);
    }

    CircadianMetrics out;
    out.name = "ivis";
    out.values["hours"] = n;
    if (total == 0.0) {
        out.values["is"] = quietNaN();
        out.values["iv"] = quietNaN();
        out.values["constant_signal"] = 1.0;
        return out;
    }

    double profileSum[kHoursPerDay] = {};
    std::size_t profileCount[kHoursPerDay] = {};
    for (std::size_t i = 0; i < x.size(); ++i) {
        profileSum[hourOfDay[i]] += x[i];
        ++profileCount[hourOfDay[i]];
    }
    double between = 0.0;
    for (int h = 0; h < kHoursPerDay; ++h) {
        if (profileCount[h] == 0) {
            continue;
        }
        double m = profileSum[h] / static_cast<double>(profileCount[h]);
        between += (m - grand) * (m - grand);
    }

    double successive = 0.0;
    for (std::size_t i = 1; i < x.size(); ++i) {
        successive += (x[i] - x[i - 1]) * (x[i] - x[i - 1]);
    }

    out.values["is"] = n * between / (static_cast<double>(kHoursPerDay) * total);
    out.values["iv"] = n * successive / ((n - 1.0) * total);
    return out;
}

CircadianMetrics computeSleepRegularity(const std::vector<int>& scores, double epochLengthSeconds) {
    if (epochLengthSeconds <= 0.0) {
        throw std::invalid_argument("Epoch length must be positive");
    }
    auto lag = static_cast<std::size_t>(std::llround(kSecondsPerDay / epochLengthSeconds));
    if (lag == 0 || scores.size() <= lag) {
        throw InsufficientDataError("More than one day of scores is needed for the sleep regularity index");
    }

    std::size_t pairs = scores.size() - lag;
    std::size_t same = 0;
    for (std::size_t i = 0; i < pairs; ++i) {
        if (scores[i] == scores[i + lag]) {
            ++same;
        }
    }

    CircadianMetrics out;
    out.name = "sri";
    out.values["sri"] = -100.0 + 200.0 * static_cast<double>(same) / static_cast<double>(pairs);
    out.values["pairs"] = static_cast<double>(pairs);
    return out;
}

}  // namespace acti
