#pragma once
// LyricsDocument.hpp - Resolved lyrics for one track

#include <string>
#include <vector>

namespace cal::lyrics {

enum class LyricsSource {
    None,
    Tag,     // embedded in the media file
    Genius,  // remote API provider
    AZLyrics // remote scrape provider
};

// Why a document looks the way it does; drives the renderer's status line
enum class LyricsStatus {
    Found,
    Pending,
    Offline,
    NoMetadata,
    NotFound,
    ProviderError
};

struct LyricsDocument {
    std::vector<std::string> lines;
    LyricsSource source{LyricsSource::None};
    bool headerCleared{false};
    LyricsStatus status{LyricsStatus::NotFound};

    static LyricsDocument none(LyricsStatus why) {
        LyricsDocument doc;
        doc.status = why;
        return doc;
    }

    bool empty() const {
        return lines.empty();
    }
    bool isRemote() const {
        return source == LyricsSource::Genius ||
               source == LyricsSource::AZLyrics;
    }

    bool operator==(const LyricsDocument&) const = default;
};

const char* toString(LyricsSource source);
const char* toString(LyricsStatus status);

} // namespace cal::lyrics
