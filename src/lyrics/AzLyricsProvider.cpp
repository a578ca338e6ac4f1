#include "AzLyricsProvider.hpp"
#include "core/Logger.hpp"
#include "lyrics/HtmlText.hpp"
#include "lyrics/LyricsText.hpp"
#include "net/HttpClient.hpp"

namespace cal::lyrics {

namespace {
// The lyrics div is the only one that opens with this licensing comment
constexpr const char* kLyricsDiv =
        "//div[comment()[contains(., 'Usage of azlyrics.com content')]]";
} // namespace

AzLyricsProvider::AzLyricsProvider(const LyricsConfig& config,
                                   net::HttpClient& http)
    : baseUrl_(config.azlyricsUrl),
      timeoutMs_(config.requestTimeoutMs),
      http_(http) {
}

std::string AzLyricsProvider::songUrl(const std::string& artist,
                                      const std::string& title) const {
    return baseUrl_ + "/lyrics/" + text::normalizeForUrl(artist) + "/" +
           text::normalizeForUrl(title) + ".html";
}

FetchResult AzLyricsProvider::fetch(const std::string& artist,
                                    const std::string& title) {
    if (text::normalizeForUrl(artist).empty() ||
        text::normalizeForUrl(title).empty()) {
        return FetchResult::notFound("Artist or title has no URL-safe characters");
    }

    net::HttpRequest request;
    request.url = songUrl(artist, title);
    request.timeoutMs = timeoutMs_;

    auto resp = http_.get(request);
    if (resp.transportFailed()) {
        return FetchResult::transientError("AZLyrics request failed: " +
                                           resp.errorMessage);
    }
    if (resp.status == 404) {
        return FetchResult::notFound("No AZLyrics page at " + request.url);
    }
    if (!resp.ok()) {
        return FetchResult::transientError("AZLyrics returned HTTP " +
                                           std::to_string(resp.status));
    }

    std::string lyrics = extractLyrics(resp.body);
    if (lyrics.empty()) {
        return FetchResult::notFound("No lyrics block on AZLyrics page");
    }
    return FetchResult::found(std::move(lyrics));
}

std::string AzLyricsProvider::extractLyrics(std::string_view html) {
    auto blocks = html::selectText(html, kLyricsDiv);
    if (blocks.empty())
        return {};
    return text::trimLeadingBlankLines(blocks.front());
}

} // namespace cal::lyrics
