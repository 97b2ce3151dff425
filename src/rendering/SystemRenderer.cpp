#include "rendering/SystemRenderer.hpp"
#include "rendering/Palette.hpp"
#include "physics/Constants.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cmath>

namespace orrery {

void SystemRenderer::drawFrame(const System& system) {
    if (!m_renderer || !m_camera) return;

    m_renderer->beginFrame();
    m_renderer->clear(m_config.background);

    for (const auto& body : system.positions()) {
        float radius = markerRadius(body.r, m_config.bodyScale, *m_camera, m_config.minRadiusPx);
        if (!m_camera->isVisible(body.x, radius)) continue;

        m_renderer->drawCircle(m_camera->worldToScreen(body.x), radius, colorFor(body.color));
    }

    Vec2 labelPos{
        0.02f * static_cast<float>(m_renderer->getScreenWidth()),
        0.05f * static_cast<float>(m_renderer->getScreenHeight())
    };
    m_renderer->drawText(timeLabel(system.t()), labelPos, m_config.labelFontSize,
                         m_config.labelColor);

    m_renderer->endFrame();
}

float SystemRenderer::markerRadius(double radius, double bodyScale, const Camera& camera,
                                   float minRadiusPx) {
    double area = std::max(0.0, static_cast<double>(camera.lengthToScreen(radius * bodyScale)));
    float r = static_cast<float>(0.5 * std::sqrt(area));
    return std::max(r, minRadiusPx);
}

std::string SystemRenderer::timeLabel(double seconds) {
    return "DAY " + std::to_string(static_cast<long long>(std::llround(seconds / DAY)));
}

const Color& SystemRenderer::colorFor(std::string_view name) {
    std::string key(name);
    auto it = m_colorCache.find(key);
    if (it != m_colorCache.end()) {
        return it->second;
    }

    auto parsed = Palette::parse(key);
    if (!parsed) {
        RENDER_LOG_WARN("SystemRenderer: unknown colour '{}', drawing white", key);
    }
    return m_colorCache.emplace(key, parsed.value_or(Color::White())).first->second;
}

} // namespace orrery
