#pragma once
#include <vector>
#include <cstddef>

namespace wakematch {

constexpr float kPreemphAlpha = 0.97f;

/* First-order high-pass, in place: y[0] = x[0], y[i] = x[i] - a·x[i-1]. */
template<typename T>
inline void preemph(T* x, size_t n, T alpha = static_cast<T>(kPreemphAlpha))
{
    if (n == 0) return;
    for (size_t i = n - 1; i > 0; --i)
        x[i] = x[i] - alpha * x[i - 1];
}

template<typename T>
inline void preemph(std::vector<T>& wav, T alpha = static_cast<T>(kPreemphAlpha))
{
    preemph(wav.data(), wav.size(), alpha);
}

} // namespace wakematch
