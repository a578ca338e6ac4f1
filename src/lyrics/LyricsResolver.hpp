#pragma once
// LyricsResolver.hpp - Decides which lyrics to show for a track
//
// Order: embedded tag -> (offline stops here) -> artist/title from tags or the
// path -> the configured remote provider -> optional header clearing ->
// optional tag write-back. The last result is cached until the identity
// changes or invalidate() is called.

#include <optional>
#include <utility>
#include "core/ConfigData.hpp"
#include "core/Track.hpp"
#include "lyrics/LyricsDocument.hpp"
#include "lyrics/TagStore.hpp"

namespace cal::lyrics {

class LyricsProvider;

struct Resolution {
    LyricsDocument document;
    // Fields to persist when save_tags applies; empty otherwise
    std::optional<TagFields> writeBack;
};

class LyricsResolver {
public:
    // provider may be null (offline, or no usable provider)
    LyricsResolver(const LyricsConfig& config,
                   TagStore& tags,
                   LyricsProvider* provider);

    // Resolve and write tags back immediately
    LyricsDocument resolve(const TrackIdentity& identity);

    // Resolve but leave the tag write to the caller (see commitWriteBack)
    Resolution resolveDeferred(const TrackIdentity& identity);
    Result<void> commitWriteBack(const TrackIdentity& identity,
                                 const TagFields& fields);

    void invalidate();

private:
    Resolution resolveUncached(const TrackIdentity& identity);

    const LyricsConfig& config_;
    TagStore& tags_;
    LyricsProvider* provider_;

    std::optional<std::pair<TrackIdentity, LyricsDocument>> cache_;
};

} // namespace cal::lyrics
