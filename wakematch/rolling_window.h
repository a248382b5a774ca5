#pragma once
#include <deque>
#include <vector>
#include <cstddef>

namespace wakematch {

/* Most recent `capacity` samples of a stream, oldest first. */
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity) : cap_(capacity) {}

    RollingWindow(double seconds, size_t sample_rate)
        : cap_(static_cast<size_t>(seconds * sample_rate)) {}

    void push(const float* data, size_t n)
    {
        for (size_t i = 0; i < n; ++i) {
            if (buf_.size() >= cap_) {
                if (cap_ == 0) return;
                buf_.pop_front();
            }
            buf_.push_back(data[i]);
        }
    }
    void push(const std::vector<float>& data) { push(data.data(), data.size()); }

    std::vector<float> samples() const { return std::vector<float>(buf_.begin(), buf_.end()); }

    size_t size()     const { return buf_.size(); }
    size_t capacity() const { return cap_; }
    void   clear()          { buf_.clear(); }

private:
    size_t            cap_;
    std::deque<float> buf_;
};

} // namespace wakematch
