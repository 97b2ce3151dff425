#include "rendering/GifRenderer.hpp"
#include "engine/Log.hpp"

#include <cstdio>
#include <utility>

namespace orrery {

GifRenderer::GifRenderer(GifConfig config)
    : m_config(std::move(config)) {}

bool GifRenderer::init(int screenWidth, int screenHeight) {
    if (screenWidth <= 0 || screenHeight <= 0) {
        RENDER_LOG_ERROR("GifRenderer: invalid frame size {}x{}", screenWidth, screenHeight);
        return false;
    }
    if (m_config.outputPath.empty()) {
        RENDER_LOG_ERROR("GifRenderer: no output path");
        return false;
    }

    Magick::InitializeMagick(nullptr);

    m_screenWidth = screenWidth;
    m_screenHeight = screenHeight;
    m_frames.clear();
    m_initialized = true;

    RENDER_LOG_INFO("GifRenderer: Initialized ({}x{}, output '{}')",
                    screenWidth, screenHeight, m_config.outputPath);
    return true;
}

void GifRenderer::shutdown() {
    m_frames.clear();
    m_inFrame = false;
    m_initialized = false;
    RENDER_LOG_INFO("GifRenderer: Shut down");
}

void GifRenderer::beginFrame() {
    m_current = Magick::Image(Magick::Geometry(static_cast<size_t>(m_screenWidth),
                                              static_cast<size_t>(m_screenHeight)),
                              Magick::Color(toHex(Color::Black())));
    m_inFrame = true;
}

void GifRenderer::endFrame() {
    if (!m_inFrame) return;

    m_current.animationDelay(static_cast<size_t>(m_config.frameDelay));
    m_current.animationIterations(static_cast<size_t>(m_config.loopCount));
    m_frames.push_back(m_current);
    m_inFrame = false;
}

void GifRenderer::clear(const Color& color) {
    if (!m_inFrame) return;
    m_current.backgroundColor(Magick::Color(toHex(color)));
    m_current.erase();
}

void GifRenderer::drawCircle(Vec2 center, float radius, const Color& color) {
    if (!m_inFrame) return;

    const Magick::Color fill(toHex(color));
    m_current.fillColor(fill);
    m_current.strokeColor(fill);
    m_current.strokeWidth(0.0);
    // DrawableCircle takes the origin and one point on the perimeter
    try {
        m_current.draw(Magick::DrawableCircle(center.x, center.y, center.x + radius, center.y));
    } catch (const Magick::Exception& e) {
        RENDER_LOG_ERROR("GifRenderer: circle draw failed: {}", e.what());
    }
}

void GifRenderer::drawText(const std::string& text, Vec2 position, int fontSize,
                           const Color& color) {
    if (!m_inFrame || m_textFailed) return;

    const Magick::Color fill(toHex(color));
    m_current.fillColor(fill);
    m_current.strokeColor(fill);
    m_current.strokeWidth(0.0);
    m_current.fontPointsize(static_cast<double>(fontSize));
    // DrawableText anchors at the baseline
    try {
        m_current.draw(Magick::DrawableText(position.x, position.y + fontSize, text));
    } catch (const Magick::Exception& e) {
        // Usually a missing font; keep encoding without labels
        RENDER_LOG_WARN("GifRenderer: text draw failed, labels disabled: {}", e.what());
        m_textFailed = true;
    }
}

bool GifRenderer::finish() {
    if (m_frames.empty()) {
        RENDER_LOG_WARN("GifRenderer: no frames to write");
        return false;
    }

    try {
        Magick::writeImages(m_frames.begin(), m_frames.end(), m_config.outputPath);
    } catch (const Magick::Exception& e) {
        RENDER_LOG_ERROR("GifRenderer: failed to write '{}': {}", m_config.outputPath, e.what());
        return false;
    }

    RENDER_LOG_INFO("GifRenderer: wrote {} frames to '{}'", m_frames.size(), m_config.outputPath);
    return true;
}

std::string GifRenderer::toHex(const Color& color) {
    char buf[10];
    if (color.a == 255) {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.r, color.g, color.b);
    } else {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
    }
    return buf;
}

} // namespace orrery
