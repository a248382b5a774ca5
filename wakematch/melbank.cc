#include "melbank.h"
#include <cmath>
#include <vector>

namespace wakematch {

/* Helper – freq (Hz) → mel,  mel → freq */
float hz_to_mel(float f)  { return 2595.f * std::log10(1.f + f / 700.f); }
float mel_to_hz(float m)  { return 700.f * (std::pow(10.f, m / 2595.f) - 1.f); }

// ---------------------------------------------------------------- mel FB
Matrix build_mel_fb(const MfccConfig& cfg)
{
    const size_t n_bins  = cfg.frame_size / 2;
    const size_t n_mels  = cfg.num_filters;
    const float  mel_min = hz_to_mel(cfg.min_freq);
    const float  mel_max = hz_to_mel(cfg.max_freq);

    /* edge points in mel scale → FFT bin numbers */
    std::vector<size_t> bin(n_mels + 2);
    for (size_t i = 0; i < bin.size(); ++i) {
        const float mel = mel_min + (mel_max - mel_min) * i / float(n_mels + 1);
        bin[i] = static_cast<size_t>(std::floor(
                     mel_to_hz(mel) * cfg.frame_size / float(cfg.sample_rate)));
    }

    /* filters – bins past the half spectrum are left at zero */
    Matrix fb(n_mels, n_bins);
    for (size_t m = 0; m < n_mels; ++m) {
        const size_t b_left   = bin[m];
        const size_t b_center = bin[m + 1];
        const size_t b_right  = bin[m + 2];

        for (size_t k = b_left; k < b_center && k < n_bins; ++k)
            fb(m, k) = (k - b_left) / float(b_center - b_left);
        for (size_t k = b_center; k < b_right && k < n_bins; ++k)
            fb(m, k) = (b_right - k) / float(b_right - b_center);
    }
    return fb;
}

// ---------------------------------------------------------------- DCT-II
Matrix build_dct(size_t n_out, size_t n_in)
{
    const double pi     = 3.14159265358979323846;
    const double scale0 = std::sqrt(1.0 / n_in);
    const double scaleN = std::sqrt(2.0 / n_in);

    Matrix dct(n_out, n_in);
    for (size_t i = 0; i < n_out; ++i)
        for (size_t j = 0; j < n_in; ++j)
            dct(i, j) = static_cast<float>(
                std::cos(pi * i * (j + 0.5) / n_in) * (i == 0 ? scale0 : scaleN));
    return dct;
}

} // namespace wakematch
