#include "trainer.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace wakematch {

const char* to_string(TrainStatus s)
{
    switch (s) {
        case TrainStatus::Ok:             return "ok";
        case TrainStatus::EmptyInput:     return "no training samples supplied";
        case TrainStatus::NoValidSamples: return "every sample is shorter than one frame";
    }
    return "unknown";
}

FeatureMatrix resample_rows(const FeatureMatrix& in, size_t target_rows)
{
    FeatureMatrix out(target_rows, in.cols());
    const size_t last = in.rows() - 1;

    for (size_t i = 0; i < target_rows; ++i) {
        size_t src = 0;
        if (target_rows > 1)
            src = static_cast<size_t>(
                std::lround(double(i) * last / double(target_rows - 1)));
        src = std::min(src, last);
        std::copy(in.row(src), in.row(src) + in.cols(), out.row(i));
    }
    return out;
}

TrainStatus train_template(const MfccExtractor& extractor,
                           const std::vector<std::vector<float>>& samples,
                           FeatureMatrix& out)
{
    if (samples.empty()) return TrainStatus::EmptyInput;

    /* 1. features per take, skipping takes too short for a single frame */
    std::vector<FeatureMatrix> feats;
    feats.reserve(samples.size());
    for (const auto& s : samples) {
        FeatureMatrix f = extractor.extract(s);
        if (!f.empty()) feats.push_back(std::move(f));
    }
    if (feats.empty()) return TrainStatus::NoValidSamples;

    /* 2. median length – one odd take does not stretch the template */
    std::vector<size_t> lengths;
    lengths.reserve(feats.size());
    for (const auto& f : feats) lengths.push_back(f.rows());
    std::sort(lengths.begin(), lengths.end());
    const size_t target = lengths[lengths.size() / 2];

    /* 3. stretch and average (double accumulator) */
    const size_t cols = extractor.config().num_mfcc;
    std::vector<double> sum(target * cols, 0.0);
    for (const auto& f : feats) {
        const FeatureMatrix r = resample_rows(f, target);
        for (size_t k = 0; k < sum.size(); ++k)
            sum[k] += r.data()[k];
    }

    FeatureMatrix tmpl(target, cols);
    for (size_t k = 0; k < sum.size(); ++k)
        tmpl.data()[k] = static_cast<float>(sum[k] / feats.size());

    out = std::move(tmpl);
    return TrainStatus::Ok;
}

} // namespace wakematch
