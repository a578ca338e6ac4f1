#include "TagLibTagStore.hpp"
#include <taglib/fileref.h>
#include <taglib/tpropertymap.h>
#include <taglib/tstring.h>
#include <taglib/tstringlist.h>
#include <array>
#include <filesystem>
#include "core/Logger.hpp"

namespace cal::lyrics {

namespace {

// ID3v2 USLT maps to LYRICS; some Vorbis/APE writers use UNSYNCEDLYRICS
constexpr std::array<const char*, 2> kLyricsKeys = {"LYRICS", "UNSYNCEDLYRICS"};

std::optional<std::string> firstValue(const TagLib::PropertyMap& props,
                                      const char* key) {
    auto it = props.find(key);
    if (it == props.end() || it->second.isEmpty())
        return std::nullopt;
    std::string value = it->second.front().to8Bit(true);
    if (value.empty())
        return std::nullopt;
    return value;
}

TagLib::StringList utf8List(const std::string& value) {
    return TagLib::StringList(TagLib::String(value, TagLib::String::UTF8));
}

} // namespace

Result<TagFields> TagLibTagStore::read(const std::string& filePath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return Result<TagFields>::err("Not a local file: " + filePath);
    }

    TagLib::FileRef f(filePath.c_str(), false);
    if (f.isNull() || !f.file()) {
        return Result<TagFields>::err("TagLib cannot open " + filePath);
    }

    const TagLib::PropertyMap props = f.file()->properties();

    TagFields fields;
    fields.artist = firstValue(props, "ARTIST");
    fields.title = firstValue(props, "TITLE");
    for (const char* key : kLyricsKeys) {
        if ((fields.lyrics = firstValue(props, key)))
            break;
    }
    return Result<TagFields>::ok(std::move(fields));
}

Result<void> TagLibTagStore::write(const std::string& filePath,
                                   const TagFields& fields) {
    TagLib::FileRef f(filePath.c_str(), false);
    if (f.isNull() || !f.file()) {
        return Result<void>::err("TagLib cannot open " + filePath);
    }
    if (f.file()->readOnly()) {
        return Result<void>::err("File is read-only: " + filePath);
    }

    TagLib::PropertyMap props = f.file()->properties();
    if (fields.artist)
        props.replace("ARTIST", utf8List(*fields.artist));
    if (fields.title)
        props.replace("TITLE", utf8List(*fields.title));
    if (fields.lyrics)
        props.replace("LYRICS", utf8List(*fields.lyrics));

    TagLib::PropertyMap rejected = f.file()->setProperties(props);
    if (fields.lyrics && rejected.contains("LYRICS")) {
        return Result<void>::err("Format does not support a lyrics tag: " +
                                 filePath);
    }

    if (!f.save()) {
        return Result<void>::err("TagLib failed to save " + filePath);
    }
    LOG_DEBUG("TagLibTagStore: Wrote tags to {}", filePath);
    return Result<void>::ok();
}

} // namespace cal::lyrics
