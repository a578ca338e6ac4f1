#pragma once
// ScrollSynchronizer.hpp - Maps playback progress or user input to a line
//
// Auto mode follows position/duration proportionally. Any manual scroll
// switches to manual until the next track change. With auto_scroll off the
// synchronizer stays manual for the whole run.

#include "core/Track.hpp"
#include "util/Types.hpp"

namespace cal {

enum class ScrollMode { Auto, Manual };

const char* toString(ScrollMode mode);

class ScrollSynchronizer {
public:
    explicit ScrollSynchronizer(bool autoScroll);

    void trackChanged(const TrackIdentity& identity);
    void tick(const PlaybackSample& sample);
    void manualScroll(i32 delta);

    // New document for the current track; keeps offset in range
    void setLineCount(usize lines);

    ScrollMode mode() const {
        return mode_;
    }
    usize offset() const {
        return offset_;
    }
    usize lineCount() const {
        return lineCount_;
    }
    const TrackIdentity& lastTrack() const {
        return lastTrack_;
    }

private:
    void clampOffset();

    bool autoScroll_;
    ScrollMode mode_;
    usize offset_{0};
    usize lineCount_{0};
    TrackIdentity lastTrack_;
};

} // namespace cal
