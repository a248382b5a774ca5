#include "detector.h"
#include "dtw.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace wakematch {

float distance_to_similarity(float distance, size_t template_rows, size_t num_mfcc)
{
    const float max_distance =
        std::sqrt(static_cast<float>(template_rows * num_mfcc)) + 1e-6f;
    const float normalized = std::min(distance / max_distance, 1.f);
    return 1.f - normalized;
}

Detector::Detector(const MfccConfig& cfg)
    : extractor_(cfg)
{
}

void Detector::set_template(FeatureMatrix tmpl)
{
    template_     = std::move(tmpl);
    has_template_ = true;
}

void Detector::set_threshold(float t)
{
    threshold_ = std::min(std::max(t, 0.f), 1.f);
}

TrainStatus Detector::train_template(const std::vector<std::vector<float>>& samples)
{
    FeatureMatrix tmpl;
    const TrainStatus st = wakematch::train_template(extractor_, samples, tmpl);
    if (st == TrainStatus::Ok)
        set_template(std::move(tmpl));
    return st;
}

Detection Detector::detect(const std::vector<float>& audio) const
{
    Detection res;
    if (!has_template_) return res;

    const FeatureMatrix feats = extractor_.extract(audio);
    if (feats.empty()) return res;

    const float dist = dtw_distance(feats, template_);
    res.similarity = distance_to_similarity(dist, template_.rows(),
                                            extractor_.config().num_mfcc);
    res.detected   = res.similarity >= threshold_;
    return res;
}

} // namespace wakematch
