#include "sleep_scoring.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace acti {

namespace {

constexpr double kSadehCap = 300.0;
constexpr int kSadehPad = 5;
constexpr int kSadehWindow = 11;
constexpr int kSadehSdWindow = 6;
constexpr double kNatsMin = 50.0;
constexpr double kNatsMax = 100.0;

// PS = A - B*AVG - C*NATS - D*SD - E*LG
constexpr double kSadehA = 7.601;
constexpr double kSadehB = 0.065;
constexpr double kSadehC = 1.08;
constexpr double kSadehD = 0.056;
constexpr double kSadehE = 0.703;

constexpr int kColeKripkeBefore = 4;
constexpr int kColeKripkeAfter = 2;
constexpr double kColeKripkeWeights[7] = {106.0, 54.0, 58.0, 76.0, 230.0, 74.0, 67.0};
constexpr double kColeKripkeScale = 0.001;
constexpr double kColeKripkeThreshold = 1.0;

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += names[i];
    }
    return out;
}

}  // namespace

SadehVariant sadehVariant(const std::string& name) {
    if (name == "actilife") {
        return SadehVariant{name, -4.0, false};
    }
    if (name == "original") {
        return SadehVariant{name, 0.0, false};
    }
    if (name == "count_scaled") {
        return SadehVariant{name, -4.0, true};
    }
    throw std::invalid_argument("Unknown Sadeh variant '" + name + "'. Expected one of: " +
                                joinNames(sadehVariantNames()));
}

ColeKripkeVariant coleKripkeVariant(const std::string& name) {
    if (name == "actilife") {
        return ColeKripkeVariant{name, 100.0, 300.0, false};
    }
    if (name == "original") {
        return ColeKripkeVariant{name, 1.0, 0.0, false};
    }
    if (name == "count_scaled") {
        return ColeKripkeVariant{name, 100.0, 300.0, true};
    }
    throw std::invalid_argument("Unknown Cole-Kripke variant '" + name + "'. Expected one of: " +
                                joinNames(coleKripkeVariantNames()));
}

std::vector<std::string> sadehVariantNames() {
    return {"actilife", "original", "count_scaled"};
}

std::vector<std::string> coleKripkeVariantNames() {
    return {"actilife", "original", "count_scaled"};
}

void validateActivityCounts(const std::vector<double>& counts) {
    if (counts.empty()) {
        throw InsufficientDataError("Activity counts are empty");
    }
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (std::isnan(counts[i])) {
            throw std::invalid_argument("Activity count is NaN at index " + std::to_string(i));
        }
        if (std::isinf(counts[i])) {
            throw std::invalid_argument("Activity count is infinite at index " + std::to_string(i));
        }
        if (counts[i] < 0.0) {
            throw std::invalid_argument("Activity count is negative at index " + std::to_string(i));
        }
    }
}

SleepScoreSeries scoreSadeh(const std::vector<double>& counts, const std::string& variant) {
    SadehVariant v = sadehVariant(variant);
    validateActivityCounts(counts);

    const std::size_t n = counts.size();
    std::vector<double> padded(n + 2 * kSadehPad, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        double c = counts[i];
        if (v.scaleCounts) {
            c = std::min(std::max(c / 100.0, 0.0), kSadehCap);
        }
        padded[i + kSadehPad] = std::min(c, kSadehCap);
    }

    SleepScoreSeries out;
    out.algorithm = "sadeh_1994_" + v.name;
    out.scores.resize(n);
    std::vector<double> ps(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto first = padded.begin() + static_cast<std::ptrdiff_t>(i);
        double avg = mean(first, first + kSadehWindow);
        double nats = static_cast<double>(std::count_if(first, first + kSadehWindow, [](double c) {
            return c >= kNatsMin && c < kNatsMax;
        }));
        double sd = sampleStdDev(first, first + kSadehSdWindow);
        double lg = std::log(padded[i + kSadehPad] + 1.0);
        ps[i] = kSadehA - kSadehB * avg - kSadehC * nats - kSadehD * sd - kSadehE * lg;
        out.scores[i] = ps[i] > v.threshold ? 1 : 0;
    }
    out.confidence = std::move(ps);
    out.parameters["threshold"] = v.threshold;
    out.parameters["activity_cap"] = kSadehCap;
    out.parameters["window_size"] = kSadehWindow;
    out.parameters["count_scaled"] = v.scaleCounts ? 1.0 : 0.0;
    return out;
}

SleepScoreSeries scoreColeKripke(const std::vector<double>& counts, const std::string& variant) {
    ColeKripkeVariant v = coleKripkeVariant(variant);
    validateActivityCounts(counts);

    const std::size_t n = counts.size();
    std::vector<double> padded(n + kColeKripkeBefore + kColeKripkeAfter, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        double c = counts[i] / v.divisor;
        if (v.clipNegative) {
            c = std::max(c, 0.0);
        }
        if (v.cap > 0.0) {
            c = std::min(c, v.cap);
        }
        padded[i + kColeKripkeBefore] = c;
    }

    SleepScoreSeries out;
    out.algorithm = "cole_kripke_1992_" + v.name;
    out.scores.resize(n);
    std::vector<double> d(n);
    for (std::size_t i = 0; i < n; ++i) {
        double sum = 0.0;
        for (int k = 0; k < 7; ++k) {
            sum += kColeKripkeWeights[k] * padded[i + static_cast<std::size_t>(k)];
        }
        d[i] = kColeKripkeScale * sum;
        out.scores[i] = d[i] < kColeKripkeThreshold ? 1 : 0;
    }
    out.confidence = std::move(d);
    out.parameters["threshold"] = kColeKripkeThreshold;
    out.parameters["scaling_factor"] = kColeKripkeScale;
    out.parameters["activity_divisor"] = v.divisor;
    out.parameters["activity_cap"] = v.cap;
    return out;
}

}  // namespace acti
