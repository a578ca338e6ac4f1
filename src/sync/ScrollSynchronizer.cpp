#include "ScrollSynchronizer.hpp"
#include <algorithm>
#include <cmath>

namespace cal {

const char* toString(ScrollMode mode) {
    switch (mode) {
    case ScrollMode::Auto:
        return "auto";
    case ScrollMode::Manual:
        return "manual";
    }
    return "unknown";
}

ScrollSynchronizer::ScrollSynchronizer(bool autoScroll)
    : autoScroll_(autoScroll),
      mode_(autoScroll ? ScrollMode::Auto : ScrollMode::Manual) {
}

void ScrollSynchronizer::trackChanged(const TrackIdentity& identity) {
    lastTrack_ = identity;
    offset_ = 0;
    mode_ = autoScroll_ ? ScrollMode::Auto : ScrollMode::Manual;
}

void ScrollSynchronizer::tick(const PlaybackSample& sample) {
    if (mode_ != ScrollMode::Auto)
        return;
    if (lineCount_ == 0) {
        offset_ = 0;
        return;
    }

    f64 ratio = 0.0;
    if (sample.durationSeconds > 0.0) {
        ratio = std::clamp(sample.positionSeconds / sample.durationSeconds,
                           0.0,
                           1.0);
    }
    offset_ = static_cast<usize>(
            std::floor(ratio * static_cast<f64>(lineCount_ - 1)));
}

void ScrollSynchronizer::manualScroll(i32 delta) {
    mode_ = ScrollMode::Manual;
    if (lineCount_ == 0) {
        offset_ = 0;
        return;
    }
    i64 target = static_cast<i64>(offset_) + delta;
    i64 last = static_cast<i64>(lineCount_) - 1;
    offset_ = static_cast<usize>(std::clamp<i64>(target, 0, last));
}

void ScrollSynchronizer::setLineCount(usize lines) {
    lineCount_ = lines;
    clampOffset();
}

void ScrollSynchronizer::clampOffset() {
    if (lineCount_ == 0)
        offset_ = 0;
    else if (offset_ > lineCount_ - 1)
        offset_ = lineCount_ - 1;
}

} // namespace cal
