#include "data_types.hpp"

namespace acti {

std::string epochAxisName(EpochAxis axis) {
    switch (axis) {
        case EpochAxis::X:
            return "x";
        case EpochAxis::Y:
            return "y";
        case EpochAxis::Z:
            return "z";
        case EpochAxis::VectorMagnitude:
            return "vector_magnitude";
    }
    return "unknown";
}

const EpochSummary& EpochSet::select(EpochAxis axis) const {
    switch (axis) {
        case EpochAxis::X:
            return x;
        case EpochAxis::Y:
            return y;
        case EpochAxis::Z:
            return z;
        case EpochAxis::VectorMagnitude:
            break;
    }
    return vectorMagnitude;
}

std::vector<NonwearRange> contiguousRanges(const std::vector<bool>& flags) {
    std::vector<NonwearRange> ranges;
    std::size_t i = 0;
    while (i < flags.size()) {
        if (!flags[i]) {
            ++i;
            continue;
        }
        std::size_t start = i;
        while (i < flags.size() && flags[i]) {
            ++i;
        }
        ranges.push_back(NonwearRange{start, i - 1});
    }
    return ranges;
}

}  // namespace acti
