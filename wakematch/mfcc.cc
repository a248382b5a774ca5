#include "mfcc.h"
#include "melbank.h"
#include "stft.h"

namespace wakematch {

MfccExtractor::MfccExtractor(const MfccConfig& cfg)
    : cfg_(cfg),
      mel_fb_(build_mel_fb(cfg)),
      dct_(build_dct(cfg.num_mfcc, cfg.num_filters))
{
}

FeatureMatrix MfccExtractor::extract(const float* audio, size_t n_samples) const
{
    /* 1. pre-emphasis → Hamming → FFT → ln power, per frame */
    const Matrix spec = stft_log_power(audio, n_samples,
                                       cfg_.frame_size, cfg_.hop_size);

    FeatureMatrix mfcc(spec.rows(), cfg_.num_mfcc);
    std::vector<float> mel(cfg_.num_filters);

    for (size_t t = 0; t < spec.rows(); ++t) {
        /* 2. spec → mel */
        mel_fb_.mul_vec(spec.row(t), mel.data());
        /* 3. mel → cepstrum */
        dct_.mul_vec(mel.data(), mfcc.row(t));
    }
    return mfcc;
}

} // namespace wakematch
