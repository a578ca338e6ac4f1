#include "HeadlessRenderer.hpp"
#include "core/Logger.hpp"

namespace cal {

void HeadlessRenderer::render(const RenderFrame& frame) {
    bool trackChanged = !rendered_ || !(frame.track == last_.track);
    bool statusChanged = !rendered_ || frame.status != last_.status ||
                         frame.lines.size() != last_.lines.size();

    if (trackChanged && !frame.track.empty())
        LOG_INFO("Now playing: {}", frame.track.describe());

    if (frame.lines.empty()) {
        if (statusChanged && !frame.status.empty())
            LOG_INFO("{}", frame.status);
    } else if (statusChanged || frame.offset != last_.offset) {
        LOG_INFO("[{} {}/{}] {}",
                 toString(frame.mode),
                 frame.offset + 1,
                 frame.lines.size(),
                 frame.lines[frame.offset]);
    }

    last_ = frame;
    rendered_ = true;
}

} // namespace cal
