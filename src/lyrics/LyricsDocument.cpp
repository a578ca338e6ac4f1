#include "LyricsDocument.hpp"

namespace cal::lyrics {

const char* toString(LyricsSource source) {
    switch (source) {
    case LyricsSource::None:
        return "none";
    case LyricsSource::Tag:
        return "tag";
    case LyricsSource::Genius:
        return "genius";
    case LyricsSource::AZLyrics:
        return "azlyrics";
    }
    return "none";
}

const char* toString(LyricsStatus status) {
    switch (status) {
    case LyricsStatus::Found:
        return "found";
    case LyricsStatus::Pending:
        return "pending";
    case LyricsStatus::Offline:
        return "offline";
    case LyricsStatus::NoMetadata:
        return "no metadata";
    case LyricsStatus::NotFound:
        return "not found";
    case LyricsStatus::ProviderError:
        return "provider error";
    }
    return "not found";
}

} // namespace cal::lyrics
