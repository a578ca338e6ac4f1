#pragma once
// GeniusProvider.hpp - Genius API search + song page extraction
// Used when an API token is configured.

#include <optional>
#include <string>
#include <string_view>
#include "lyrics/LyricsProvider.hpp"

namespace cal::lyrics {

class GeniusProvider : public LyricsProvider {
public:
    GeniusProvider(const LyricsConfig& config, net::HttpClient& http);

    FetchResult fetch(const std::string& artist,
                      const std::string& title) override;
    LyricsSource source() const override {
        return LyricsSource::Genius;
    }
    std::string_view name() const override {
        return "genius";
    }

    struct SongHit {
        std::string title;
        std::string artist;
        std::string url;
    };

    // Picks the song hit from a /search response body. Non-song hits and
    // remix/instrumental versions (unless asked for) are skipped; a hit by
    // the requested artist wins over the first remaining one.
    static std::optional<SongHit> pickHit(const std::string& searchJson,
                                          const std::string& artist,
                                          const std::string& title);

    // Lyrics text from a song page, empty if the page has no lyrics block
    static std::string extractLyrics(std::string_view html);

    // Strips page furniture that leaks into the extracted text
    static std::string cleanText(std::string text, std::string_view songTitle);

private:
    std::string apiUrl_;
    std::string token_;
    u32 timeoutMs_;
    net::HttpClient& http_;
};

} // namespace cal::lyrics
