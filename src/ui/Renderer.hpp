#pragma once
// Renderer.hpp - Presentation seam for the session loop
//
// The session hands over a complete frame every time something changes and
// drains discrete input events; how characters reach the terminal is the
// renderer's business.

#include <string>
#include <vector>
#include "core/Track.hpp"
#include "sync/ScrollSynchronizer.hpp"
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace cal {

struct RenderFrame {
    std::vector<std::string> lines;
    usize offset{0};
    ScrollMode mode{ScrollMode::Manual};
    std::string status; // shown instead of lines when lines is empty
    TrackIdentity track;
};

enum class InputKind { Scroll, Refresh, Quit, Resize };

struct InputEvent {
    InputKind kind{InputKind::Scroll};
    i32 delta{0}; // lines, for Scroll

    bool operator==(const InputEvent&) const = default;
};

class Renderer {
public:
    virtual ~Renderer() = default;

    virtual Result<void> init() = 0;
    virtual void shutdown() = 0;

    virtual void render(const RenderFrame& frame) = 0;

    // Everything typed since the last call; never blocks
    virtual std::vector<InputEvent> readInput() = 0;

    // True when input arrives on stdin
    virtual bool interactive() const = 0;
};

} // namespace cal
