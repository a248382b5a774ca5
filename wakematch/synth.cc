#include "synth.h"
#include <cmath>

namespace wakematch {

std::vector<float> chirp(size_t sample_rate, float seconds,
                         float f0, float f1, float amplitude)
{
    const double twopi = 6.283185307179586;
    const size_t n = static_cast<size_t>(sample_rate * seconds);

    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        const double t    = double(i) / sample_rate;
        const double freq = f0 + (f1 - f0) * t / seconds;
        out[i] = static_cast<float>(amplitude * std::sin(twopi * freq * t));
    }
    return out;
}

float NoiseSource::next(float amplitude)
{
    /* Numerical Recipes LCG, top 24 bits → [0, 1) */
    state_ = state_ * 1664525u + 1013904223u;
    const float u = (state_ >> 8) / 16777216.f;
    return amplitude * (2.f * u - 1.f);
}

std::vector<float> NoiseSource::generate(size_t n, float amplitude)
{
    std::vector<float> out(n);
    for (auto& v : out) v = next(amplitude);
    return out;
}

} // namespace wakematch
