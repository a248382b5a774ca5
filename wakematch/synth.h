#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

namespace wakematch {

/* Linear sweep f0 → f1 over `seconds`, phase = 2π·(f0 + (f1-f0)·t)·t. */
std::vector<float> chirp(size_t sample_rate, float seconds,
                         float f0, float f1, float amplitude = 0.5f);

/* Uniform white noise from a 32-bit LCG.  Owned by the caller – two sources
   with the same seed produce the same samples. */
class NoiseSource {
public:
    explicit NoiseSource(uint32_t seed = 1u) : state_(seed) {}

    /* next sample in [-amplitude, amplitude] */
    float next(float amplitude = 1.f);

    std::vector<float> generate(size_t n, float amplitude);

private:
    uint32_t state_;
};

} // namespace wakematch
