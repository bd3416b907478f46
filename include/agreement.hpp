#pragma once

#include "data_types.hpp"

#include <vector>

namespace acti {

// Cohen's kappa over two binary raters (1 = sleep). Rater 1 is the reference
// for sensitivity and specificity. Throws std::invalid_argument on length
// mismatch and InsufficientDataError on empty input.
AgreementMetric cohensKappa(const std::vector<int>& rater1, const std::vector<int>& rater2);

}  // namespace acti
