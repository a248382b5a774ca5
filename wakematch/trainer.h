#pragma once
#include "matrix.h"
#include "mfcc.h"
#include <vector>
#include <cstddef>

namespace wakematch {

enum class TrainStatus {
    Ok,
    EmptyInput,       // no recordings supplied
    NoValidSamples,   // every recording was shorter than one frame
};

const char* to_string(TrainStatus s);

/* Nearest-index time resampling to target_rows rows:
   out[i] = in[round(i · (rows-1) / (target_rows-1))], target_rows == 1 → in[0].
   in must be non-empty. */
FeatureMatrix resample_rows(const FeatureMatrix& in, size_t target_rows);

/* Build one template from several takes of the same utterance:
   MFCC per take, drop takes with no frames, stretch the rest to the median
   frame count and average them.  out is written only on TrainStatus::Ok. */
TrainStatus train_template(const MfccExtractor& extractor,
                           const std::vector<std::vector<float>>& samples,
                           FeatureMatrix& out);

} // namespace wakematch
