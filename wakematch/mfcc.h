#pragma once
#include "config.h"
#include "matrix.h"
#include <vector>
#include <cstddef>

namespace wakematch {

/* PCM → MFCC frames.  The mel filter bank and DCT basis are built once in
   the constructor; extract() is const and allocates its own FFT plan, so one
   extractor may serve several threads. */
class MfccExtractor {
public:
    explicit MfccExtractor(const MfccConfig& cfg = MfccConfig{});

    /* Returns frame_count × num_mfcc.  Audio shorter than one frame gives
       0 × num_mfcc – not an error. */
    FeatureMatrix extract(const float* audio, size_t n_samples) const;
    FeatureMatrix extract(const std::vector<float>& audio) const
    {
        return extract(audio.data(), audio.size());
    }

    const MfccConfig& config() const { return cfg_; }
    const Matrix&     mel_fb() const { return mel_fb_; }
    const Matrix&     dct()    const { return dct_; }

private:
    MfccConfig cfg_;
    Matrix     mel_fb_;    // num_filters × frame_size/2
    Matrix     dct_;       // num_mfcc × num_filters
};

} // namespace wakematch
