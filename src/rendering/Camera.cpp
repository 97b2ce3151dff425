#include "rendering/Camera.hpp"

namespace orrery {

Camera::Camera(float screenWidth, float screenHeight, double canvasSize)
    : m_screenSize(screenWidth, screenHeight) {
    setCanvasSize(canvasSize);
}

void Camera::setCanvasSize(double canvasSize) {
    if (canvasSize > 0.0) {
        m_canvasSize = canvasSize;
    }
}

void Camera::setScreenSize(float width, float height) {
    m_screenSize = {width, height};
}

Vec2 Camera::worldToScreen(Vec2d worldPos) const {
    return {
        static_cast<float>(m_screenSize.x * 0.5 + worldPos.x * scaleX()),
        static_cast<float>(m_screenSize.y * 0.5 - worldPos.y * scaleY())
    };
}

float Camera::lengthToScreen(double meters) const {
    return static_cast<float>(meters * scaleX());
}

bool Camera::isVisible(Vec2d worldPos, float marginPx) const {
    Vec2 p = worldToScreen(worldPos);
    return p.x >= -marginPx && p.x <= m_screenSize.x + marginPx &&
           p.y >= -marginPx && p.y <= m_screenSize.y + marginPx;
}

} // namespace orrery
