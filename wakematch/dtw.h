#pragma once
#include "matrix.h"
#include <limits>
#include <cstddef>

namespace wakematch {

/* Returned by dtw_distance when either sequence is empty. */
constexpr float kNoMatchDistance = std::numeric_limits<float>::max();

/* L2 distance between two rows of length dim. */
float frame_distance(const float* a, const float* b, size_t dim);

/* Minimum-cost monotonic alignment of a (n × d) against b (m × d), using
   L2 frame cost and the (diag, up, left) step set.  O(n·m) time and memory.
   a and b must have the same column count. */
float dtw_distance(const FeatureMatrix& a, const FeatureMatrix& b);

} // namespace wakematch
