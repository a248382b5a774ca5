// test_dtw.cc – DTW sequence matcher
#include "wakematch/dtw.h"
#include "wakematch/mfcc.h"
#include "wakematch/synth.h"

#include <cstdio>
#include <cmath>
#include <vector>

using namespace wakematch;

static FeatureMatrix make(size_t rows, size_t cols, const std::vector<float>& v)
{
    FeatureMatrix m(rows, cols);
    for (size_t k = 0; k < v.size() && k < rows * cols; ++k) m.data()[k] = v[k];
    return m;
}

// ---------- identical sequences -------------------------------------------------
static bool test_self()
{
    auto a = make(3, 2, {1, 2, 3, 4, 5, 6});
    float d = dtw_distance(a, a);
    bool ok = d < 1e-6f;
    std::printf("[dtw-self] d=%.6f → %s\n", d, ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- hand-computed alignment ----------------------------------------------
static bool test_known()
{
    /* 1-D: a = {0, 1, 2}, b = {0, 2}
       best path (0,0) (1,0|1) (2,1): 0 + 1 + 0 = 1 */
    auto a = make(3, 1, {0, 1, 2});
    auto b = make(2, 1, {0, 2});
    float d  = dtw_distance(a, b);
    float dr = dtw_distance(b, a);
    bool ok = std::fabs(d - 1.f) < 1e-6f && std::fabs(dr - 1.f) < 1e-6f;
    std::printf("[dtw-known] d=%.4f reversed=%.4f → %s\n", d, dr, ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- time-stretched copy costs nothing -------------------------------------
static bool test_stretch()
{
    auto a = make(3, 2, {0, 0, 3, 4, 6, 8});
    auto b = make(6, 2, {0, 0, 0, 0, 3, 4, 3, 4, 6, 8, 6, 8});
    float d = dtw_distance(a, b);
    bool ok = d < 1e-6f;
    std::printf("[dtw-stretch] d=%.6f → %s\n", d, ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- empty side → sentinel ---------------------------------------------
static bool test_empty()
{
    auto a = make(3, 2, {1, 2, 3, 4, 5, 6});
    FeatureMatrix e(0, 2);
    bool ok = dtw_distance(a, e) == kNoMatchDistance &&
              dtw_distance(e, a) == kNoMatchDistance &&
              dtw_distance(e, e) == kNoMatchDistance;
    std::printf("[dtw-empty] → %s\n", ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- non-negative on real features -----------------------------------------
static bool test_nonneg()
{
    MfccExtractor ex;
    NoiseSource noise(7);
    auto a = ex.extract(chirp(16'000, 0.5f, 300.f, 1500.f));
    auto b = ex.extract(noise.generate(12'000, 0.2f));

    float d1 = dtw_distance(a, b);
    float d2 = dtw_distance(a, a);
    bool ok = d1 >= 0.f && std::isfinite(d1) && d2 >= 0.f && d2 < 1e-3f && d1 > d2;
    std::printf("[dtw-nonneg] sweep/noise=%.2f sweep/sweep=%.4f → %s\n",
                d1, d2, ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- main -------------------------------------------------------------
int main()
{
    bool ok =  test_self()    &
               test_known()   &
               test_stretch() &
               test_empty()   &
               test_nonneg();

    std::printf("═══════════════════════════════════════════\n"
                "DTW tests %s\n", ok ? "PASSED" : "FAILED");
    return ok ? 0 : 1;
}
