#include "dtw.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace wakematch {

float frame_distance(const float* a, const float* b, size_t dim)
{
    float cost = 0.f;
    for (size_t k = 0; k < dim; ++k) {
        const float diff = a[k] - b[k];
        cost += diff * diff;
    }
    return std::sqrt(cost);
}

float dtw_distance(const FeatureMatrix& a, const FeatureMatrix& b)
{
    const size_t n = a.rows();
    const size_t m = b.rows();
    if (n == 0 || m == 0) return kNoMatchDistance;

    const size_t dim = std::min(a.cols(), b.cols());
    const size_t W   = m + 1;
    const float  inf = std::numeric_limits<float>::infinity();

    std::vector<float> acc((n + 1) * W, inf);
    acc[0] = 0.f;

    for (size_t i = 1; i <= n; ++i) {
        const float* ai = a.row(i - 1);
        for (size_t j = 1; j <= m; ++j) {
            const float cost = frame_distance(ai, b.row(j - 1), dim);
            const float best = std::min({ acc[(i - 1) * W + (j - 1)],     // diag
                                          acc[(i - 1) * W + j],           // up
                                          acc[i * W + (j - 1)] });        // left
            acc[i * W + j] = cost + best;
        }
    }
    return acc[n * W + m];
}

} // namespace wakematch
