// test_stream.cc – capture-side helpers: sample-format conversion, the
// rolling window, the seeded noise source and the stream scanner.
#include "wakematch/detector.h"
#include "wakematch/pcm.h"
#include "wakematch/rolling_window.h"
#include "wakematch/stream_scanner.h"
#include "wakematch/synth.h"

#include <algorithm>
#include <cstdio>
#include <cmath>
#include <cstdint>
#include <vector>

using namespace wakematch;

// ---------- per-sample conversions -------------------------------------------
static bool test_convert()
{
    bool ok = from_i16(32767) == 1.f &&
              from_i16(0) == 0.f &&
              std::fabs(from_i16(-32767) + 1.f) < 1e-6f &&
              from_u16(32768) == 0.f &&
              from_u16(0) == -1.f &&
              std::fabs(from_u16(65535) - 32767.f / 32768.f) < 1e-6f &&
              from_f32(0.25f) == 0.25f;
    std::printf("[convert] u16(0)=%.3f i16(max)=%.3f → %s\n",
                from_u16(0), from_i16(32767), ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- converter picks the routine once, downmixes ------------------------
static bool test_converter()
{
    std::vector<float> out;

    const int16_t stereo[] = { 32767, -32767, 16384, 16384 };   // 2 frames
    SampleConverter c16(SampleFormat::I16, 2);
    c16.append(stereo, 2, out);

    const uint16_t mono[] = { 32768, 65535 };
    SampleConverter cu(SampleFormat::U16, 1);
    cu.append(mono, 2, out);

    const float quad[] = { 0.1f, 0.2f, 0.3f, 0.4f };             // 1 frame, 4 ch
    SampleConverter cf(SampleFormat::F32, 4);
    cf.append(quad, 1, out);

    bool ok = out.size() == 5 &&
              std::fabs(out[0]) < 1e-6f &&
              std::fabs(out[1] - 16384.f / 32767.f) < 1e-6f &&
              out[2] == 0.f &&
              std::fabs(out[3] - 32767.f / 32768.f) < 1e-6f &&
              std::fabs(out[4] - 0.25f) < 1e-6f &&
              c16.channels() == 2 && cu.format() == SampleFormat::U16;
    std::printf("[converter] n=%zu → %s\n", out.size(), ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- rolling window keeps the newest samples --------------------------------
static bool test_window()
{
    RollingWindow w(4);
    const float a[] = { 1, 2, 3 };
    const float b[] = { 4, 5, 6 };
    w.push(a, 3);
    bool partial = w.size() == 3 && w.samples()[0] == 1.f;
    w.push(b, 3);

    auto s = w.samples();
    bool full = s.size() == 4 && s[0] == 3.f && s[3] == 6.f && w.capacity() == 4;

    w.clear();
    RollingWindow two_s(2.0, 16'000);

    bool ok = partial && full && w.size() == 0 && two_s.capacity() == 32'000;
    std::printf("[window] head=%.0f tail=%.0f → %s\n",
                full ? s[0] : -1.f, full ? s[3] : -1.f, ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- noise: seeded, bounded, caller-owned ----------------------------------
static bool test_noise()
{
    NoiseSource a(99), b(99), c(100);
    auto xa = a.generate(1000, 0.1f);
    auto xb = b.generate(1000, 0.1f);
    auto xc = c.generate(1000, 0.1f);

    bool bounded = true;
    double mean = 0.0;
    for (float v : xa) {
        if (v < -0.1f || v > 0.1f) bounded = false;
        mean += v;
    }
    mean /= xa.size();

    bool ok = xa == xb && xa != xc && bounded && std::fabs(mean) < 0.01;
    std::printf("[noise] mean=%.4f bounded=%d → %s\n",
                mean, int(bounded), ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- chirp length and amplitude ----------------------------------------
static bool test_chirp()
{
    auto s = chirp(16'000, 1.f, 300.f, 1500.f, 0.5f);
    float peak = 0.f;
    for (float v : s) peak = std::fmax(peak, std::fabs(v));

    bool ok = s.size() == 16000 && s[0] == 0.f && peak <= 0.5f && peak > 0.49f;
    std::printf("[chirp] n=%zu peak=%.3f → %s\n", s.size(), peak, ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- scanner re-trigger guard ----------------------------------------------
static bool test_scanner()
{
    Detector det;
    det.set_template(det.extract(NoiseSource(5).generate(16'000, 0.3f)));
    det.set_threshold(0.f);                      // every check is a hit

    auto stream = NoiseSource(6).generate(160'000, 0.3f);

    /* 3 s guard: 100 ms blocks, first hit at 0.1 s then every 3.0 s */
    StreamScanner whole(det);
    auto hits = whole.feed(stream.data(), stream.size());
    const size_t expect[] = { 1'600, 49'600, 97'600, 145'600 };
    bool guard_ok = hits.size() == 4;
    for (size_t k = 0; guard_ok && k < 4; ++k)
        guard_ok = hits[k].end_sample == expect[k];

    /* uneven chunks land on the same block boundaries */
    StreamScanner chunked(det);
    std::vector<ScanHit> chunk_hits;
    for (size_t off = 0; off < stream.size(); off += 1'000) {
        const size_t n = std::min<size_t>(1'000, stream.size() - off);
        for (const ScanHit& h : chunked.feed(stream.data() + off, n))
            chunk_hits.push_back(h);
    }
    bool chunk_ok = chunk_hits.size() == hits.size() &&
                    chunked.position() == stream.size();
    for (size_t k = 0; chunk_ok && k < hits.size(); ++k)
        chunk_ok = chunk_hits[k].end_sample == hits[k].end_sample &&
                   chunk_hits[k].similarity == hits[k].similarity;

    /* no guard: a check per block, each over the last 2 s of the stream,
       so a hit does not empty the window */
    StreamScanner eager(det, 2.0, 0.1, 0.0);
    auto all = eager.feed(stream.data(), stream.size());
    bool window_ok = all.size() == 100;
    for (size_t k = 0; window_ok && k < all.size(); k += 7) {
        const size_t end   = all[k].end_sample;
        const size_t begin = end > 32'000 ? end - 32'000 : 0;
        std::vector<float> tail(stream.begin() + begin, stream.begin() + end);
        window_ok = det.detect(tail).similarity == all[k].similarity;
    }

    bool ok = guard_ok && chunk_ok && window_ok;
    std::printf("[scanner] hits=%zu chunked=%zu eager=%zu → %s\n",
                hits.size(), chunk_hits.size(), all.size(), ok ? "PASS" : "FAIL");
    return ok;
}

// ---------- main -------------------------------------------------------------
int main()
{
    bool ok =  test_convert()   &
               test_converter() &
               test_window()    &
               test_noise()     &
               test_chirp()     &
               test_scanner();

    std::printf("═══════════════════════════════════════════\n"
                "Stream helper tests %s\n", ok ? "PASSED" : "FAILED");
    return ok ? 0 : 1;
}
