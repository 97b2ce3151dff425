#pragma once

#include "rendering/IRenderer.hpp"
#include "engine/Window.hpp"

#include <utility>

namespace orrery {

/// Live viewer. Frames go straight to a Raylib window; nothing is kept.
class RaylibRenderer : public IRenderer {
public:
    explicit RaylibRenderer(WindowConfig config = WindowConfig(), bool showFps = false)
        : m_config(std::move(config)), m_showFps(showFps) {}

    bool init(int screenWidth, int screenHeight) override;
    void shutdown() override;

    void beginFrame() override;
    void endFrame() override;
    void clear(const Color& color) override;

    int getScreenWidth() const override { return m_window.width(); }
    int getScreenHeight() const override { return m_window.height(); }

    void drawCircle(Vec2 center, float radius, const Color& color) override;
    void drawText(const std::string& text, Vec2 position, int fontSize,
                  const Color& color) override;

    bool shouldClose() const override { return m_window.closeRequested(); }
    const char* name() const override { return "window"; }

    uint64_t framesPresented() const { return m_framesPresented; }

private:
    WindowConfig m_config;
    Window m_window;
    bool m_showFps = false;
    uint64_t m_framesPresented = 0;
};

} // namespace orrery
