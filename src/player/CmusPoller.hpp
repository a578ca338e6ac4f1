#pragma once
// CmusPoller.hpp - PlayerPoller over `cmus-remote -Q`

#include <string_view>
#include "core/ConfigData.hpp"
#include "player/PlayerPoller.hpp"

namespace cal {

class CmusPoller : public PlayerPoller {
public:
    explicit CmusPoller(const PlayerConfig& config);

    std::optional<PlaybackSample> poll() override;

    // Parses the `-Q` status dump. Unknown lines are ignored.
    static PlaybackSample parseStatus(std::string_view output);

private:
    const PlayerConfig& config_;
    bool reachable_{true};
};

} // namespace cal
