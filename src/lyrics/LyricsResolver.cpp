#include "LyricsResolver.hpp"
#include "core/Logger.hpp"
#include "lyrics/LyricsProvider.hpp"
#include "lyrics/LyricsText.hpp"
#include "lyrics/MetadataGuesser.hpp"

namespace cal::lyrics {

namespace {
bool present(const std::optional<std::string>& field) {
    return field && !text::trim(*field).empty();
}
} // namespace

LyricsResolver::LyricsResolver(const LyricsConfig& config,
                               TagStore& tags,
                               LyricsProvider* provider)
    : config_(config), tags_(tags), provider_(provider) {
}

LyricsDocument LyricsResolver::resolve(const TrackIdentity& identity) {
    auto resolution = resolveDeferred(identity);
    if (resolution.writeBack) {
        // Failure is logged inside and never affects what is shown
        (void)commitWriteBack(identity, *resolution.writeBack);
    }
    return std::move(resolution.document);
}

Resolution LyricsResolver::resolveDeferred(const TrackIdentity& identity) {
    if (cache_ && cache_->first == identity) {
        LOG_DEBUG("LyricsResolver: Cache hit for {}", identity.describe());
        return {cache_->second, std::nullopt};
    }

    auto resolution = resolveUncached(identity);
    LOG_INFO("LyricsResolver: {} -> {} ({} lines, source {})",
             identity.describe(),
             toString(resolution.document.status),
             resolution.document.lines.size(),
             toString(resolution.document.source));

    cache_.emplace(identity, resolution.document);
    return resolution;
}

Result<void> LyricsResolver::commitWriteBack(const TrackIdentity& identity,
                                             const TagFields& fields) {
    auto res = tags_.write(identity.filePath, fields);
    if (res) {
        LOG_INFO("LyricsResolver: Saved lyrics tags for {}",
                 identity.describe());
    } else {
        LOG_WARN("LyricsResolver: Could not save tags for {}: {}",
                 identity.describe(),
                 res.error().message);
    }
    return res;
}

void LyricsResolver::invalidate() {
    cache_.reset();
}

Resolution LyricsResolver::resolveUncached(const TrackIdentity& identity) {
    TagFields stored;
    if (auto read = tags_.read(identity.filePath)) {
        stored = std::move(read.value());
    } else {
        LOG_DEBUG("LyricsResolver: No tags for {}: {}",
                  identity.filePath,
                  read.error().message);
    }

    // 1. Embedded lyrics are authoritative and shown as-is
    if (present(stored.lyrics)) {
        LyricsDocument doc;
        doc.lines = text::splitLines(*stored.lyrics);
        doc.source = LyricsSource::Tag;
        doc.status = LyricsStatus::Found;
        return {std::move(doc), std::nullopt};
    }

    // 2.
    if (config_.offline) {
        return {LyricsDocument::none(LyricsStatus::Offline), std::nullopt};
    }
    if (!provider_) {
        // No usable remote provider behaves like offline
        return {LyricsDocument::none(LyricsStatus::Offline), std::nullopt};
    }

    // 3. Player tags, then file tags, then the path
    std::optional<std::string> artist =
            present(identity.artist) ? identity.artist : stored.artist;
    std::optional<std::string> title =
            present(identity.title) ? identity.title : stored.title;
    if (!present(artist) || !present(title)) {
        auto guessed = MetadataGuesser::guess(identity.filePath);
        if (!present(artist))
            artist = guessed.artist;
        if (!present(title))
            title = guessed.title;
    }
    if (!present(artist) || !present(title)) {
        return {LyricsDocument::none(LyricsStatus::NoMetadata), std::nullopt};
    }

    // 4.
    auto fetched = provider_->fetch(*artist, *title);
    switch (fetched.status) {
    case FetchStatus::NotFound:
        LOG_INFO("LyricsResolver: {} has no lyrics on {}: {}",
                 identity.describe(),
                 provider_->name(),
                 fetched.message);
        return {LyricsDocument::none(LyricsStatus::NotFound), std::nullopt};
    case FetchStatus::TransientError:
        LOG_WARN("LyricsResolver: {} lookup failed: {}",
                 provider_->name(),
                 fetched.message);
        return {LyricsDocument::none(LyricsStatus::ProviderError),
                std::nullopt};
    case FetchStatus::Found:
        break;
    }

    LyricsDocument doc;
    doc.lines = text::splitLines(fetched.text);
    doc.source = provider_->source();
    doc.status = LyricsStatus::Found;

    // 5.
    if (config_.clearHeaders) {
        doc.lines = text::clearHeaders(doc.lines);
        doc.headerCleared = true;
    }

    if (doc.lines.empty()) {
        return {LyricsDocument::none(LyricsStatus::NotFound), std::nullopt};
    }

    // 6. Only reached when the tag had no lyrics
    std::optional<TagFields> writeBack;
    if (config_.saveTags) {
        writeBack = TagFields{artist, title, text::joinLines(doc.lines)};
    }
    return {std::move(doc), std::move(writeBack)};
}

} // namespace cal::lyrics
