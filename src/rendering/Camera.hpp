#pragma once

#include "rendering/IRenderer.hpp"
#include "physics/Vec2d.hpp"

namespace orrery {

/// Maps world coordinates (metres, y up) to screen pixels (y down).
///
/// The square [-canvasSize, +canvasSize] on both axes, centred on the
/// origin, fills the screen. Non-square screens stretch each axis independently.
class Camera {
public:
    Camera() = default;
    Camera(float screenWidth, float screenHeight, double canvasSize);

    /// Half extent of the visible world square, in metres. Non-positive
    /// values are ignored.
    void setCanvasSize(double canvasSize);
    double getCanvasSize() const { return m_canvasSize; }

    void setScreenSize(float width, float height);
    Vec2 getScreenSize() const { return m_screenSize; }

    /// Pixels per metre along each axis
    double scaleX() const { return m_screenSize.x / (2.0 * m_canvasSize); }
    double scaleY() const { return m_screenSize.y / (2.0 * m_canvasSize); }

    /// Convert world coordinates to screen coordinates
    Vec2 worldToScreen(Vec2d worldPos) const;

    /// Convert a world length along x to pixels
    float lengthToScreen(double meters) const;

    /// Check if a world point lands on screen, allowing `marginPx` overhang
    bool isVisible(Vec2d worldPos, float marginPx = 0.0f) const;

private:
    Vec2 m_screenSize = {800.0f, 800.0f};
    double m_canvasSize = 250e9;
};

} // namespace orrery
