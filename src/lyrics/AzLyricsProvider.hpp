#pragma once
// AzLyricsProvider.hpp - AZLyrics page scraper
// Used when no API token is configured.

#include <string>
#include <string_view>
#include "lyrics/LyricsProvider.hpp"

namespace cal::lyrics {

class AzLyricsProvider : public LyricsProvider {
public:
    AzLyricsProvider(const LyricsConfig& config, net::HttpClient& http);

    FetchResult fetch(const std::string& artist,
                      const std::string& title) override;
    LyricsSource source() const override {
        return LyricsSource::AZLyrics;
    }
    std::string_view name() const override {
        return "azlyrics";
    }

    // <base>/lyrics/<artist>/<title>.html with both parts normalized
    std::string songUrl(const std::string& artist,
                        const std::string& title) const;

    // Lyrics block of a song page, empty if there is none
    static std::string extractLyrics(std::string_view html);

private:
    std::string baseUrl_;
    u32 timeoutMs_;
    net::HttpClient& http_;
};

} // namespace cal::lyrics
