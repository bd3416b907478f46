#pragma once

#include "data_types.hpp"

#include <string>
#include <vector>

namespace acti {

// Variance/range heuristic on raw axes. Defaults are the van_hees_2023 set.
struct VanHeesNonwearConfig {
    std::string name{"van_hees_2023"};
    double sdCriterion{0.013};     // g
    double rangeCriterion{0.15};   // g
    double windowSeconds{900.0};
    int minimumAxes{2};
};

VanHeesNonwearConfig vanHeesParameterSet(const std::string& name);
std::vector<std::string> vanHeesParameterSetNames();

// Number of axes (0..3) that look still in each complete window.
std::vector<int> vanHeesWindowScores(const RawSampleSet& raw, const VanHeesNonwearConfig& config = {});

// One flag per raw sample; samples past the last complete window are wear.
NonwearSeries detectNonwearVanHees(const RawSampleSet& raw, const VanHeesNonwearConfig& config = {});

// Choi (2011) on 60 s activity counts.
struct ChoiConfig {
    std::size_t minPeriod{90};
    std::size_t spikeTolerance{2};
    std::size_t windowSize{30};
};

NonwearSeries detectNonwearChoi(const std::vector<double>& counts, const ChoiConfig& config = {});

struct CapsenseConfig {
    std::size_t minimumRunRecords{1};
};

// One flag per capsense record; nonwear where the sensor reports no skin contact.
NonwearSeries detectNonwearCapsense(const CapsenseChannel& channel, const CapsenseConfig& config = {});

// Throws std::invalid_argument when the set carries no capsense channel.
NonwearSeries detectNonwearCapsense(const RawSampleSet& raw, const CapsenseConfig& config = {});

}  // namespace acti
