#include "stream_scanner.h"
#include <algorithm>

namespace wakematch {

StreamScanner::StreamScanner(const Detector& det,
                             double window_s, double block_s, double cooldown_s)
    : det_(det),
      window_(window_s, det.config().sample_rate),
      block_(std::max<size_t>(1, static_cast<size_t>(block_s * det.config().sample_rate))),
      cooldown_(static_cast<size_t>(cooldown_s * det.config().sample_rate))
{
}

std::vector<ScanHit> StreamScanner::feed(const float* data, size_t n)
{
    std::vector<ScanHit> hits;
    while (n > 0) {
        const size_t take = std::min(n, block_ - pending_);
        window_.push(data, take);
        data     += take;
        n        -= take;
        pos_     += take;
        pending_ += take;
        if (had_hit_) since_hit_ += take;

        if (pending_ == block_) {
            pending_ = 0;
            on_block(hits);
        }
    }
    return hits;
}

void StreamScanner::on_block(std::vector<ScanHit>& hits)
{
    if (window_.size() < block_) return;
    if (had_hit_ && since_hit_ < cooldown_) return;

    const Detection d = det_.detect(window_.samples());
    if (!d.detected) return;

    hits.push_back(ScanHit{ pos_, d.similarity });
    had_hit_   = true;
    since_hit_ = 0;
}

} // namespace wakematch
