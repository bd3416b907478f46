#pragma once

#include "data_types.hpp"

namespace acti {

struct ImputationConfig {
    double gapToleranceSeconds{1.0};  // allowed excess over one sample period
    double maxGapMinutes{90.0};       // cap on replicated duration per gap
    bool normalizeReplicatedRows{true};
    bool replaceZeroSamples{true};
};

// All-zero rows are cleaned first: a leading one becomes (0, 0, 1), a trailing
// one copies its predecessor and interior ones are dropped. Timestamp gaps are
// then filled by replicating the last sample before each gap; with
// normalisation on, that sample is rescaled to unit norm in place.
ImputationOutcome imputeGaps(const RawSampleSet& raw, const ImputationConfig& config = {});

// Copies the filled arrays back into a sample set, keeping metadata and channels.
RawSampleSet withImputation(const RawSampleSet& raw, const ImputationOutcome& outcome);

}  // namespace acti
