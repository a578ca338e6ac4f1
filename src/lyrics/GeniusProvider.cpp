#include "GeniusProvider.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>
#include <array>
#include <cctype>
#include <vector>
#include "core/Logger.hpp"
#include "lyrics/HtmlText.hpp"
#include "lyrics/LyricsText.hpp"
#include "net/HttpClient.hpp"

namespace cal::lyrics {

namespace {

constexpr std::array<std::string_view, 2> kExcludedTerms = {"(Remix)",
                                                            "instrumental"};

bool isExcluded(const std::string& hitTitle, const std::string& wanted) {
    for (auto term : kExcludedTerms) {
        if (text::containsIgnoreCase(hitTitle, term) &&
            !text::containsIgnoreCase(wanted, term))
            return true;
    }
    return false;
}

// Strip suffix from the end of s (and whitespace before it); true if removed
bool stripSuffix(std::string& s, std::string_view suffix) {
    if (s.size() < suffix.size() ||
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) != 0)
        return false;
    s.erase(s.size() - suffix.size());
    return true;
}

void eraseAll(std::string& s, std::string_view what) {
    if (what.empty())
        return;
    size_t pos = 0;
    while ((pos = s.find(what, pos)) != std::string::npos)
        s.erase(pos, what.size());
}

} // namespace

GeniusProvider::GeniusProvider(const LyricsConfig& config, net::HttpClient& http)
    : apiUrl_(config.geniusApiUrl),
      token_(config.geniusToken),
      timeoutMs_(config.requestTimeoutMs),
      http_(http) {
}

FetchResult GeniusProvider::fetch(const std::string& artist,
                                  const std::string& title) {
    const std::string query = title + " " + artist;

    net::HttpRequest search;
    search.url = apiUrl_ + "/search?q=" +
                 QUrl::toPercentEncoding(QString::fromStdString(query))
                         .toStdString();
    search.headers = {{"Authorization", "Bearer " + token_},
                      {"Accept", "application/json"}};
    search.timeoutMs = timeoutMs_;

    auto searchResp = http_.get(search);
    if (searchResp.transportFailed()) {
        return FetchResult::transientError("Genius search failed: " +
                                           searchResp.errorMessage);
    }
    if (searchResp.status == 401 || searchResp.status == 403) {
        LOG_ERROR("GeniusProvider: API token rejected (HTTP {})",
                  searchResp.status);
        return FetchResult::transientError("Genius API token rejected");
    }
    if (!searchResp.ok()) {
        return FetchResult::transientError(
                "Genius search returned HTTP " +
                std::to_string(searchResp.status));
    }

    auto hit = pickHit(searchResp.body, artist, title);
    if (!hit) {
        return FetchResult::notFound("No matching song on Genius");
    }
    LOG_DEBUG("GeniusProvider: Using '{}' by '{}' ({})",
              hit->title,
              hit->artist,
              hit->url);

    net::HttpRequest page;
    page.url = hit->url;
    page.timeoutMs = timeoutMs_;

    auto pageResp = http_.get(page);
    if (pageResp.transportFailed()) {
        return FetchResult::transientError("Genius page fetch failed: " +
                                           pageResp.errorMessage);
    }
    if (pageResp.status == 404) {
        return FetchResult::notFound("Genius song page missing");
    }
    if (!pageResp.ok()) {
        return FetchResult::transientError("Genius page returned HTTP " +
                                           std::to_string(pageResp.status));
    }

    std::string lyrics = extractLyrics(pageResp.body);
    if (lyrics.empty()) {
        return FetchResult::notFound("No lyrics block on Genius page");
    }

    lyrics = cleanText(std::move(lyrics), hit->title);
    if (text::trim(lyrics).empty()) {
        return FetchResult::notFound("Genius lyrics are empty");
    }
    return FetchResult::found(std::move(lyrics));
}

std::optional<GeniusProvider::SongHit> GeniusProvider::pickHit(
        const std::string& searchJson,
        const std::string& artist,
        const std::string& title) {
    QJsonDocument doc =
            QJsonDocument::fromJson(QByteArray::fromStdString(searchJson));
    if (!doc.isObject()) {
        LOG_WARN("GeniusProvider: Search response is not a JSON object");
        return std::nullopt;
    }

    QJsonArray hits = doc.object()["response"].toObject()["hits"].toArray();
    const std::string wantedArtist = text::normalizeForUrl(artist);

    std::optional<SongHit> first;
    for (const auto& item : hits) {
        QJsonObject hitObj = item.toObject();
        if (hitObj["type"].toString() != QStringLiteral("song"))
            continue;

        QJsonObject result = hitObj["result"].toObject();
        SongHit hit;
        hit.title = result["title"].toString().toStdString();
        hit.artist = result["primary_artist"]
                             .toObject()["name"]
                             .toString()
                             .toStdString();
        hit.url = result["url"].toString().toStdString();

        if (hit.url.empty() || isExcluded(hit.title, title))
            continue;

        if (!wantedArtist.empty() &&
            text::normalizeForUrl(hit.artist) == wantedArtist)
            return hit;
        if (!first)
            first = std::move(hit);
    }
    return first;
}

std::string GeniusProvider::extractLyrics(std::string_view html) {
    auto blocks = html::selectText(html,
                                   "//div[@data-lyrics-container=\"true\"]",
                                   "//*[@data-exclude-from-selection=\"true\"]");

    std::string out;
    for (const auto& part : blocks) {
        if (part.empty())
            continue;
        if (!out.empty())
            out += '\n';
        out += part;
    }
    return out;
}

std::string GeniusProvider::cleanText(std::string text,
                                      std::string_view songTitle) {
    if (!songTitle.empty()) {
        eraseAll(text, std::string(songTitle) + " Lyrics");
    }
    eraseAll(text, "Share URLCopyCopy");
    eraseAll(text, "You might also like");

    // Trailing "123Embed" counter
    std::string tail = text::trim(text);
    if (stripSuffix(tail, "Embed")) {
        for (int i = 0; i < 3 && !tail.empty() &&
                        std::isdigit(static_cast<unsigned char>(tail.back()));
             ++i)
            tail.pop_back();
        text = tail;
    }

    std::vector<std::string> kept;
    for (auto& line : text::splitLines(text)) {
        if (line.find("Contributors") == std::string::npos)
            kept.push_back(std::move(line));
    }
    return text::trimLeadingBlankLines(text::joinLines(kept));
}

} // namespace cal::lyrics
