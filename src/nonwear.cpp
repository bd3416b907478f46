#include "nonwear.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace acti {

namespace {

// Periods whose edges are at most this many epochs apart are joined.
constexpr std::size_t kChoiMergeGapEpochs = 1;

int stillAxes(const RawSampleSet& raw, std::size_t first, std::size_t last, const VanHeesNonwearConfig& config) {
    const std::vector<double>* axes[3] = {&raw.x, &raw.y, &raw.z};
    int count = 0;
    for (const auto* axis : axes) {
        auto b = axis->begin() + static_cast<std::ptrdiff_t>(first);
        auto e = axis->begin() + static_cast<std::ptrdiff_t>(last);
        auto [lo, hi] = std::minmax_element(b, e);
        if (*hi - *lo < config.rangeCriterion && sampleStdDev(b, e) < config.sdCriterion) {
            ++count;
        }
    }
    return count;
}

void removeShortRuns(std::vector<bool>& flags, std::size_t minimumRun) {
    for (const auto& r : contiguousRanges(flags)) {
        if (r.end - r.start + 1 < minimumRun) {
            std::fill(flags.begin() + static_cast<std::ptrdiff_t>(r.start),
                      flags.begin() + static_cast<std::ptrdiff_t>(r.end + 1), false);
        }
    }
}

}  // namespace

VanHeesNonwearConfig vanHeesParameterSet(const std::string& name) {
    if (name == "van_hees_2013") {
        return VanHeesNonwearConfig{name, 0.003, 0.05, 1800.0, 2};
    }
    if (name == "van_hees_2023") {
        return VanHeesNonwearConfig{name, 0.013, 0.15, 900.0, 2};
    }
    throw std::invalid_argument("Unknown van Hees parameter set '" + name + "'");
}

std::vector<std::string> vanHeesParameterSetNames() {
    return {"van_hees_2013", "van_hees_2023"};
}

std::vector<int> vanHeesWindowScores(const RawSampleSet& raw, const VanHeesNonwearConfig& config) {
    if (!raw.isConsistent()) {
        throw std::invalid_argument("Axis and timestamp arrays differ in length");
    }
    if (raw.sampleRate <= 0.0 || config.windowSeconds <= 0.0) {
        throw std::invalid_argument("Sample rate and window length must be positive");
    }
    auto window = static_cast<std::size_t>(config.windowSeconds * raw.sampleRate);
    std::vector<int> scores;
    if (window < 2) {
        return scores;
    }
    std::size_t windows = raw.size() / window;
    scores.reserve(windows);
    for (std::size_t w = 0; w < windows; ++w) {
        scores.push_back(stillAxes(raw, w * window, (w + 1) * window, config));
    }
    return scores;
}

NonwearSeries detectNonwearVanHees(const RawSampleSet& raw, const VanHeesNonwearConfig& config) {
    std::vector<int> scores = vanHeesWindowScores(raw, config);
    auto window = static_cast<std::size_t>(config.windowSeconds * raw.sampleRate);

    NonwearSeries out;
    out.algorithm = config.name;
    out.parameters["sd_criterion"] = config.sdCriterion;
    out.parameters["range_criterion"] = config.rangeCriterion;
    out.parameters["window_seconds"] = config.windowSeconds;
    out.parameters["minimum_axes"] = config.minimumAxes;
    out.nonwear.assign(raw.size(), false);
    for (std::size_t w = 0; w < scores.size(); ++w) {
        if (scores[w] >= config.minimumAxes) {
            std::fill(out.nonwear.begin() + static_cast<std::ptrdiff_t>(w * window),
                      out.nonwear.begin() + static_cast<std::ptrdiff_t>((w + 1) * window), true);
        }
    }
    out.ranges = contiguousRanges(out.nonwear);
    return out;
}

NonwearSeries detectNonwearChoi(const std::vector<double>& counts, const ChoiConfig& config) {
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (!std::isfinite(counts[i]) || counts[i] < 0.0) {
            throw std::invalid_argument("Activity count is not a finite non-negative value at index " +
                                        std::to_string(i));
        }
    }

    NonwearSeries out;
    out.algorithm = "choi_2011";
    out.parameters["min_period"] = static_cast<double>(config.minPeriod);
    out.parameters["spike_tolerance"] = static_cast<double>(config.spikeTolerance);
    out.parameters["window_size"] = static_cast<double>(config.windowSize);
    out.nonwear.assign(counts.size(), false);

    const std::size_t n = counts.size();
    std::vector<NonwearRange> periods;
    std::size_t i = 0;
    while (i < n) {
        if (counts[i] > 0.0) {
            ++i;
            continue;
        }
        std::size_t start = i;
        std::size_t end = i;
        std::size_t j = i;
        while (j < n) {
            if (counts[j] == 0.0) {
                end = j;
                ++j;
                continue;
            }
            std::size_t lo = j > config.windowSize ? j - config.windowSize : 0;
            std::size_t hi = std::min(n, j + config.windowSize);
            auto nonzero = static_cast<std::size_t>(std::count_if(
                counts.begin() + static_cast<std::ptrdiff_t>(lo), counts.begin() + static_cast<std::ptrdiff_t>(hi),
                [](double c) { return c > 0.0; }));
            if (nonzero > config.spikeTolerance) {
                break;
            }
            ++j;
        }
        if (end - start + 1 >= config.minPeriod) {
            periods.push_back(NonwearRange{start, end});
            i = end + 1;
        } else {
            ++i;
        }
    }

    std::vector<NonwearRange> merged;
    for (const auto& p : periods) {
        if (!merged.empty() && p.start <= merged.back().end + kChoiMergeGapEpochs) {
            merged.back().end = std::max(merged.back().end, p.end);
        } else {
            merged.push_back(p);
        }
    }
    for (const auto& p : merged) {
        std::fill(out.nonwear.begin() + static_cast<std::ptrdiff_t>(p.start),
                  out.nonwear.begin() + static_cast<std::ptrdiff_t>(p.end + 1), true);
    }
    out.ranges = contiguousRanges(out.nonwear);
    return out;
}

NonwearSeries detectNonwearCapsense(const CapsenseChannel& channel, const CapsenseConfig& config) {
    NonwearSeries out;
    out.algorithm = "capsense";
    out.parameters["minimum_run_records"] = static_cast<double>(config.minimumRunRecords);
    out.nonwear.resize(channel.state.size());
    for (std::size_t i = 0; i < channel.state.size(); ++i) {
        out.nonwear[i] = channel.state[i] == 0;
    }
    if (config.minimumRunRecords > 1) {
        removeShortRuns(out.nonwear, config.minimumRunRecords);
    }
    out.ranges = contiguousRanges(out.nonwear);
    return out;
}

NonwearSeries detectNonwearCapsense(const RawSampleSet& raw, const CapsenseConfig& config) {
    if (!raw.capsense) {
        throw std::invalid_argument("capsense channel not present");
    }
    return detectNonwearCapsense(*raw.capsense, config);
}

}  // namespace acti
