#pragma once
// Track.hpp - What is playing right now
// TrackIdentity drives lyrics caching and change detection; PlaybackSample is
// one poll of the player.

#include <optional>
#include <string>
#include "util/Types.hpp"

namespace cal {

struct TrackIdentity {
    std::optional<std::string> artist;
    std::optional<std::string> title;
    std::string filePath;

    // Both artist and title present and non-empty
    bool hasTags() const;
    bool empty() const {
        return filePath.empty() && !hasTags();
    }

    // "Artist - Title" or the file path, for logs and status lines
    std::string describe() const;

    // Same artist+title when both sides are tagged, otherwise same path
    bool operator==(const TrackIdentity& other) const;
};

enum class Transport { Playing, Paused, Stopped };

struct PlaybackSample {
    TrackIdentity track;
    f64 positionSeconds{0.0};
    f64 durationSeconds{0.0}; // 0 when nothing is loaded
    Transport transport{Transport::Stopped};

    bool hasTrack() const {
        return !track.empty();
    }
};

const char* toString(Transport transport);

} // namespace cal
