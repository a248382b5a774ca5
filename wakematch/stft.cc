#include "stft.h"
#include "preemph.h"
#include <cmath>
#include <algorithm>
#include <memory>
#include <new>
#include "kiss_fft.h"

namespace wakematch {

namespace {

struct KissFftFree {
    void operator()(void* cfg) const { kiss_fft_free(cfg); }
};
using KissFftPlan = std::unique_ptr<kiss_fft_state, KissFftFree>;

} // namespace

// ─────────────────────── Hamming window
std::vector<float> hamming(size_t N)
{
    std::vector<float> w(N, 1.f);
    if (N < 2) return w;

    const double twopi = 6.283185307179586;
    /* fill both halves from the same value so w[n] == w[N-1-n] exactly */
    for (size_t n = 0; n < (N + 1) / 2; ++n) {
        const float v = static_cast<float>(
            0.54 - 0.46 * std::cos(twopi * n / (N - 1)));
        w[n]         = v;
        w[N - 1 - n] = v;
    }
    return w;
}

size_t frame_count(size_t n_samples, size_t win_len, size_t hop)
{
    if (n_samples < win_len) return 0;
    return (n_samples - win_len) / hop + 1;
}

// ─────────────────────── STFT → log power spectrum
Matrix
stft_log_power(const float* wav, size_t n_samples, size_t win_len, size_t hop)
{
    const size_t n_bins   = win_len / 2;
    const size_t n_frames = frame_count(n_samples, win_len, hop);

    Matrix out(n_frames, n_bins);
    if (n_frames == 0) return out;

    const auto win = hamming(win_len);

    /* KissFFT complex plan – any length, not only even ones */
    KissFftPlan cfg(kiss_fft_alloc(static_cast<int>(win_len),
                                   /*inverse=*/0, nullptr, nullptr));
    if (!cfg) throw std::bad_alloc();

    std::vector<float>        frame(win_len);
    std::vector<kiss_fft_cpx> buf_time(win_len);
    std::vector<kiss_fft_cpx> buf_freq(win_len);

    for (size_t i = 0; i < n_frames; ++i)
    {
        const float* src = wav + i * hop;
        std::copy(src, src + win_len, frame.begin());

        preemph(frame);

        for (size_t n = 0; n < win_len; ++n) {
            buf_time[n].r = frame[n] * win[n];
            buf_time[n].i = 0.f;
        }

        kiss_fft(cfg.get(), buf_time.data(), buf_freq.data());

        /* ln |X|² (bins 0 … win_len/2 - 1) */
        float* dst = out.row(i);
        for (size_t k = 0; k < n_bins; ++k) {
            const float re = buf_freq[k].r;
            const float im = buf_freq[k].i;
            dst[k] = std::log(re*re + im*im + kPowerFloor);
        }
    }
    return out;
}

} // namespace wakematch
