#pragma once
#include "detector.h"
#include "rolling_window.h"
#include <vector>
#include <cstddef>

namespace wakematch {

struct ScanHit {
    size_t end_sample;    // stream offset just past the block that matched
    float  similarity;
};

/* Feeds a stream through a rolling window and runs the detector once per
   block.  After a hit, checks are skipped until `cooldown` seconds of audio
   have gone by; the window keeps filling meanwhile. */
class StreamScanner {
public:
    StreamScanner(const Detector& det,
                  double window_s   = 2.0,
                  double block_s    = 0.1,
                  double cooldown_s = 3.0);

    /* Appends n samples and returns the hits they produced. */
    std::vector<ScanHit> feed(const float* data, size_t n);

    size_t position() const { return pos_; }

private:
    void on_block(std::vector<ScanHit>& hits);

    const Detector& det_;
    RollingWindow   window_;
    size_t          block_;
    size_t          cooldown_;
    size_t          pos_         = 0;   // samples fed so far
    size_t          pending_     = 0;   // samples since the last check
    size_t          since_hit_   = 0;
    bool            had_hit_     = false;
};

} // namespace wakematch
