/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * Plain structs holding configuration values. Kept apart from the logic
 * classes so that lyrics and session code can depend on a single section
 * without pulling in toml++.
 */

#pragma once
#include <string>
#include "util/Types.hpp"

namespace cal {

// Lyrics lookup and post-processing
struct LyricsConfig {
    std::string geniusToken; // empty => scrape provider
    bool clearHeaders{false};
    bool saveTags{false};
    bool offline{false};
    u32 requestTimeoutMs{10000};
    std::string geniusApiUrl{"https://api.genius.com"};
    std::string azlyricsUrl{"https://www.azlyrics.com"};

    bool hasToken() const {
        return !geniusToken.empty();
    }
};

struct ScrollConfig {
    bool autoScroll{false};
};

// External player (cmus) polling
struct PlayerConfig {
    std::string remoteCommand{"cmus-remote"};
    u32 pollIntervalMs{1000};
    u32 maxBackoffMs{8000};
    u32 commandTimeoutMs{2000};
};

// Terminal presentation
struct UIConfig {
    bool center{false};
    u32 limitHeight{0}; // 0 = use the whole terminal
    i32 color{-1};
    i32 colorCurrent{3};
    bool enabled{true}; // false => headless, log to stderr
};

} // namespace cal
