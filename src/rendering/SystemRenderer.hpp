#pragma once

#include "rendering/IRenderer.hpp"
#include "rendering/Camera.hpp"
#include "physics/System.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace orrery {

struct SystemRenderConfig {
    double bodyScale     = 250.0;   ///< Physical radius multiplier before projection
    Color  background    = Color::Black();
    Color  labelColor    = Color::White();
    int    labelFontSize = 20;
    float  minRadiusPx   = 1.0f;
};

/// Draws one frame of a System: every body as a filled circle plus the
/// elapsed-days label in the top-left corner.
class SystemRenderer {
public:
    explicit SystemRenderer(SystemRenderConfig config = SystemRenderConfig())
        : m_config(config) {}

    void setRenderer(IRenderer* renderer) { m_renderer = renderer; }
    void setCamera(const Camera* camera) { m_camera = camera; }

    SystemRenderConfig& getConfig() { return m_config; }
    const SystemRenderConfig& getConfig() const { return m_config; }

    /// Draw and present one frame. No-op without a renderer and camera.
    void drawFrame(const System& system);

    /// On-screen marker radius in pixels. The scaled physical radius,
    /// projected to pixels, is treated as the marker *area* (scatter-plot
    /// convention), which keeps the Sun and Pluto on one legible scale.
    static float markerRadius(double radius, double bodyScale, const Camera& camera,
                              float minRadiusPx = 1.0f);

    /// "DAY <n>" with n = round(t / 86400).
    static std::string timeLabel(double seconds);

private:
    const Color& colorFor(std::string_view name);

    SystemRenderConfig m_config;
    IRenderer* m_renderer = nullptr;
    const Camera* m_camera = nullptr;

    // Resolved colours by name; unknown names are reported once
    std::unordered_map<std::string, Color> m_colorCache;
};

} // namespace orrery
