#pragma once
// HeadlessRenderer.hpp - --no-ui mode: frames become log lines

#include "ui/Renderer.hpp"

namespace cal {

class HeadlessRenderer : public Renderer {
public:
    Result<void> init() override {
        return Result<void>::ok();
    }
    void shutdown() override {
    }

    // Logs only when track, status, line count or offset changed
    void render(const RenderFrame& frame) override;

    std::vector<InputEvent> readInput() override {
        return {};
    }
    bool interactive() const override {
        return false;
    }

private:
    bool rendered_{false};
    RenderFrame last_;
};

} // namespace cal
