#include "Track.hpp"

namespace cal {

namespace {
bool present(const std::optional<std::string>& field) {
    return field && !field->empty();
}
} // namespace

bool TrackIdentity::hasTags() const {
    return present(artist) && present(title);
}

std::string TrackIdentity::describe() const {
    if (hasTags())
        return *artist + " - " + *title;
    if (present(title))
        return *title;
    return filePath;
}

bool TrackIdentity::operator==(const TrackIdentity& other) const {
    if (hasTags() && other.hasTags())
        return *artist == *other.artist && *title == *other.title;
    if (hasTags() != other.hasTags())
        return false;
    return filePath == other.filePath && artist == other.artist &&
           title == other.title;
}

const char* toString(Transport transport) {
    switch (transport) {
    case Transport::Playing:
        return "playing";
    case Transport::Paused:
        return "paused";
    case Transport::Stopped:
        return "stopped";
    }
    return "stopped";
}

} // namespace cal
