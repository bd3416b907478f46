#pragma once

#include "data_types.hpp"

#include <string>
#include <vector>

namespace acti {

// Named coefficient sets for the epoch-count scorers.
struct SadehVariant {
    std::string name;
    double threshold{-4.0};
    bool scaleCounts{false};  // divide by 100 and clip to [0, 300] first
};

struct ColeKripkeVariant {
    std::string name;
    double divisor{100.0};
    double cap{300.0};        // <= 0 disables the cap
    bool clipNegative{false};
};

SadehVariant sadehVariant(const std::string& name);
ColeKripkeVariant coleKripkeVariant(const std::string& name);
std::vector<std::string> sadehVariantNames();
std::vector<std::string> coleKripkeVariantNames();

// Throws InsufficientDataError for empty input and std::invalid_argument for
// NaN, infinite or negative counts.
void validateActivityCounts(const std::vector<double>& counts);

// Sadeh (1994) on 60 s counts. Confidence carries the PS value of each epoch.
SleepScoreSeries scoreSadeh(const std::vector<double>& counts, const std::string& variant = "actilife");

// Cole-Kripke (1992) on 60 s counts. Confidence carries the D value of each epoch.
SleepScoreSeries scoreColeKripke(const std::vector<double>& counts, const std::string& variant = "actilife");

}  // namespace acti
