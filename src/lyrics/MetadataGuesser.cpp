#include "MetadataGuesser.hpp"
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

namespace cal::lyrics {

namespace fs = std::filesystem;

namespace {

// First two segments of name split on sep; both must be non-empty
std::optional<std::pair<std::string, std::string>> splitPair(
        std::string_view name, std::string_view sep) {
    auto first = name.find(sep);
    if (first == std::string_view::npos)
        return std::nullopt;

    auto artist = name.substr(0, first);
    auto rest = name.substr(first + sep.size());
    auto title = rest.substr(0, rest.find(sep));

    if (artist.empty() || title.empty())
        return std::nullopt;
    return std::make_pair(std::string(artist), std::string(title));
}

} // namespace

TrackIdentity MetadataGuesser::guess(const std::string& filePath) {
    TrackIdentity id;
    id.filePath = filePath;

    fs::path path(filePath);
    while (!path.empty() && !path.has_filename() && path.has_parent_path() &&
           path != path.parent_path()) {
        path = path.parent_path(); // "dir/song/" -> "dir/song"
    }

    const std::string name = path.stem().string();
    if (name.empty())
        return id;

    for (std::string_view sep : {std::string_view(" - "), std::string_view("-")}) {
        if (auto split = splitPair(name, sep)) {
            id.artist = std::move(split->first);
            id.title = std::move(split->second);
            return id;
        }
    }

    id.title = name;
    auto parent = path.parent_path().filename().string();
    if (!parent.empty() && parent != "/" && parent != ".")
        id.artist = parent;
    return id;
}

} // namespace cal::lyrics
