#pragma once
#include "detector.h"
#include <mutex>
#include <utility>
#include <vector>

namespace wakematch {

/* Detector shared between a capture callback and a decision loop.
   Every call holds one exclusive lock for its whole duration, so a detect()
   never sees a half-replaced template. */
class LockedDetector {
public:
    explicit LockedDetector(const MfccConfig& cfg = MfccConfig{})
        : det_(cfg) {}

    Detection detect(const std::vector<float>& audio) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return det_.detect(audio);
    }

    TrainStatus train_template(const std::vector<std::vector<float>>& samples)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return det_.train_template(samples);
    }

    void set_template(FeatureMatrix tmpl)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        det_.set_template(std::move(tmpl));
    }

    void set_threshold(float t)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        det_.set_threshold(t);
    }

    float threshold() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return det_.threshold();
    }

    bool has_template() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return det_.has_template();
    }

private:
    Detector           det_;
    mutable std::mutex mutex_;
};

} // namespace wakematch
