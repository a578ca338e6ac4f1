#pragma once
// TagStore.hpp - Read/write access to a media file's text tags

#include <optional>
#include <string>
#include "util/Result.hpp"

namespace cal::lyrics {

struct TagFields {
    std::optional<std::string> artist;
    std::optional<std::string> title;
    std::optional<std::string> lyrics;
};

class TagStore {
public:
    virtual ~TagStore() = default;

    virtual Result<TagFields> read(const std::string& filePath) = 0;
    // Present fields are written, absent ones left untouched, in one save
    virtual Result<void> write(const std::string& filePath,
                               const TagFields& fields) = 0;
};

} // namespace cal::lyrics
