#pragma once
#include "config.h"
#include "matrix.h"
#include "mfcc.h"
#include "trainer.h"
#include <vector>
#include <cstddef>

namespace wakematch {

struct Detection {
    bool  detected   = false;
    float similarity = 0.f;    // 0 … 1
};

/* Maps a DTW distance to a 0 … 1 similarity using
   sqrt(template_rows · num_mfcc) as the assumed worst-case cost.
   The normaliser is a heuristic, not a bound – scores can saturate at 0 or 1
   for unusual configurations.  Tune here if needed. */
float distance_to_similarity(float distance, size_t template_rows, size_t num_mfcc);

/* Single-template MFCC + DTW matcher. */
class Detector {
public:
    explicit Detector(const MfccConfig& cfg = MfccConfig{});

    FeatureMatrix extract(const std::vector<float>& audio) const
    {
        return extractor_.extract(audio);
    }

    /* Replaces the template wholesale. */
    void set_template(FeatureMatrix tmpl);
    bool has_template() const { return has_template_; }
    const FeatureMatrix& get_template() const { return template_; }

    /* Out-of-range values are clamped to [0, 1]. */
    void  set_threshold(float t);
    float threshold() const { return threshold_; }

    /* Keeps the previous template if training fails. */
    TrainStatus train_template(const std::vector<std::vector<float>>& samples);

    /* (false, 0) when untrained or when the audio is shorter than a frame. */
    Detection detect(const std::vector<float>& audio) const;

    const MfccConfig& config() const { return extractor_.config(); }

private:
    MfccExtractor extractor_;
    FeatureMatrix template_;
    bool          has_template_ = false;
    float         threshold_    = kDefaultThreshold;
};

} // namespace wakematch
