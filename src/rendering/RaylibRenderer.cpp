#include "rendering/RaylibRenderer.hpp"
#include "engine/Log.hpp"

#include <raylib.h>

namespace orrery {

namespace {

::Color toRaylib(const Color& c) {
    return {c.r, c.g, c.b, c.a};
}

} // namespace

bool RaylibRenderer::init(int screenWidth, int screenHeight) {
    m_config.width = screenWidth;
    m_config.height = screenHeight;
    if (!m_window.open(m_config)) {
        return false;
    }

    m_framesPresented = 0;
    RENDER_LOG_INFO("RaylibRenderer: window {}x{} at {} fps", m_window.width(), m_window.height(),
                    m_config.targetFPS);
    return true;
}

void RaylibRenderer::shutdown() {
    if (!m_window.isOpen()) return;
    m_window.close();
    RENDER_LOG_INFO("RaylibRenderer: closed after {} frames", m_framesPresented);
}

void RaylibRenderer::beginFrame() {
    BeginDrawing();
}

void RaylibRenderer::endFrame() {
    if (m_showFps) {
        DrawFPS(m_window.width() - 90, 10);
    }
    EndDrawing();
    ++m_framesPresented;
}

void RaylibRenderer::clear(const Color& color) {
    ClearBackground(toRaylib(color));
}

void RaylibRenderer::drawCircle(Vec2 center, float radius, const Color& color) {
    DrawCircleV(Vector2{center.x, center.y}, radius, toRaylib(color));
}

void RaylibRenderer::drawText(const std::string& text, Vec2 position, int fontSize,
                              const Color& color) {
    DrawText(text.c_str(), static_cast<int>(position.x), static_cast<int>(position.y),
             fontSize, toRaylib(color));
}

} // namespace orrery
