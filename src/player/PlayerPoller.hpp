#pragma once
// PlayerPoller.hpp - One sample of the external player per call

#include <optional>
#include "core/Track.hpp"

namespace cal {

class PlayerPoller {
public:
    virtual ~PlayerPoller() = default;

    // nullopt: the player could not be reached (not the same as stopped)
    virtual std::optional<PlaybackSample> poll() = 0;
};

} // namespace cal
