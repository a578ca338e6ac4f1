#pragma once
// LyricsProvider.hpp - Uniform lookup contract for remote lyrics sources

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include "core/ConfigData.hpp"
#include "lyrics/LyricsDocument.hpp"

namespace cal::net {
class HttpClient;
}

namespace cal::lyrics {

enum class FetchStatus { Found, NotFound, TransientError };

struct FetchResult {
    FetchStatus status{FetchStatus::NotFound};
    std::string text;
    std::string message;

    static FetchResult found(std::string text) {
        return {FetchStatus::Found, std::move(text), {}};
    }
    static FetchResult notFound(std::string why = {}) {
        return {FetchStatus::NotFound, {}, std::move(why)};
    }
    static FetchResult transientError(std::string why) {
        return {FetchStatus::TransientError, {}, std::move(why)};
    }
};

class LyricsProvider {
public:
    virtual ~LyricsProvider() = default;

    virtual FetchResult fetch(const std::string& artist,
                              const std::string& title) = 0;
    virtual LyricsSource source() const = 0;
    virtual std::string_view name() const = 0;
};

// Picks the one remote provider for this run: Genius when a token is
// configured, AZLyrics otherwise. Returns nullptr when offline or when no
// provider is usable (both endpoints unconfigured).
std::unique_ptr<LyricsProvider> makeProvider(const LyricsConfig& config,
                                             net::HttpClient& http);

} // namespace cal::lyrics
