#include "LyricsProvider.hpp"
#include "core/Logger.hpp"
#include "lyrics/AzLyricsProvider.hpp"
#include "lyrics/GeniusProvider.hpp"

namespace cal::lyrics {

std::unique_ptr<LyricsProvider> makeProvider(const LyricsConfig& config,
                                             net::HttpClient& http) {
    if (config.offline) {
        LOG_INFO("Offline mode: lyrics are read from tags only");
        return nullptr;
    }

    if (config.hasToken()) {
        if (!config.geniusApiUrl.empty()) {
            LOG_INFO("Lyrics provider: Genius API ({})", config.geniusApiUrl);
            return std::make_unique<GeniusProvider>(config, http);
        }
        LOG_WARN("Genius token given but genius_api_url is empty");
    }

    if (!config.azlyricsUrl.empty()) {
        LOG_INFO("Lyrics provider: AZLyrics ({})", config.azlyricsUrl);
        return std::make_unique<AzLyricsProvider>(config, http);
    }

    LOG_WARN("No usable lyrics provider configured; remote lookups disabled");
    return nullptr;
}

} // namespace cal::lyrics
