#pragma once
#include <cstddef>

namespace wakematch {

/* MFCC analysis parameters – fixed for the lifetime of a Detector.
   Defaults: 16 kHz, 32 ms window, 8 ms hop (75 % overlap). */
struct MfccConfig {
    size_t sample_rate = 16'000;
    size_t frame_size  = 512;      // samples per analysis window
    size_t hop_size    = 128;      // stride between windows
    size_t num_mfcc    = 13;       // output coefficients per frame
    size_t num_filters = 26;       // mel filterbank rows
    float  min_freq    = 300.f;
    float  max_freq    = 8'000.f;

    /* Not enforced by the core – an invalid config is a caller error. */
    bool valid() const
    {
        return frame_size > 0 &&
               hop_size > 0 && hop_size <= frame_size &&
               num_mfcc <= num_filters &&
               min_freq >= 0.f && min_freq < max_freq &&
               max_freq <= sample_rate / 2.f;
    }
};

constexpr float kDefaultThreshold = 0.7f;

} // namespace wakematch
