#pragma once
// CursesRenderer.hpp - ncurses front end
// Owns the terminal between init() and shutdown().

#include "core/ConfigData.hpp"
#include "ui/Renderer.hpp"

namespace cal {

class CursesRenderer : public Renderer {
public:
    explicit CursesRenderer(const UIConfig& config);
    ~CursesRenderer() override;

    Result<void> init() override;
    void shutdown() override;

    void render(const RenderFrame& frame) override;
    std::vector<InputEvent> readInput() override;

    bool interactive() const override {
        return true;
    }

private:
    void drawStatus(const std::string& status, usize row, usize width);

    const UIConfig& config_;
    bool active_{false};
    bool colors_{false};
};

} // namespace cal
