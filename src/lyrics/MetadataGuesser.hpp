#pragma once
// MetadataGuesser.hpp - Artist/title from a file path
//
// Tried in order, first match wins:
//   "<artist> - <title>.<ext>"
//   "<artist>-<title>.<ext>"
//   "<parent dir>/<title>.<ext>"
// Returns an identity with absent fields when nothing yields a title.

#include <string>
#include "core/Track.hpp"

namespace cal::lyrics {

class MetadataGuesser {
public:
    static TrackIdentity guess(const std::string& filePath);
};

} // namespace cal::lyrics
