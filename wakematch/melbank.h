#pragma once
#include "config.h"
#include "matrix.h"
#include <cstddef>

namespace wakematch {

/* HTK mel scale */
float hz_to_mel(float f);
float mel_to_hz(float m);

/* Triangular mel filter bank, num_filters × frame_size/2.
   Filter edges are num_filters + 2 points evenly spaced in mel between
   min_freq and max_freq, mapped to bins with floor(hz · N / sr). */
Matrix build_mel_fb(const MfccConfig& cfg);

/* Orthonormal DCT-II basis, n_out × n_in. */
Matrix build_dct(size_t n_out, size_t n_in);

} // namespace wakematch
