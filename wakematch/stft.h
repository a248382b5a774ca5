#pragma once
#include "matrix.h"
#include <vector>
#include <cstddef>

namespace wakematch {

/* Floor added to |X|² before the log so silent bins stay finite. */
constexpr float kPowerFloor = 1e-10f;

/* Symmetric 1-D Hamming window of length win_len. */
std::vector<float> hamming(size_t win_len);

/* Number of whole frames that fit in n_samples (0 if shorter than one). */
size_t frame_count(size_t n_samples, size_t win_len, size_t hop);

/* Framed log-power spectrum of mono PCM.
   Every frame is pre-emphasised on its own, Hamming-windowed and
   transformed with a win_len-point FFT; only bins 0 … win_len/2 - 1 are
   kept, as ln(|X|² + kPowerFloor).
   Returns frame_count(...) × win_len/2. */
Matrix
stft_log_power(const float* wav, size_t n_samples,
               size_t win_len = 512,
               size_t hop     = 128);

} // namespace wakematch
