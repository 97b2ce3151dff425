#include "engine/Window.hpp"
#include "engine/Log.hpp"

#include <raylib.h>

namespace orrery {

Window::~Window() {
    close();
}

bool Window::open(const WindowConfig& config) {
    if (m_open) {
        RENDER_LOG_WARN("Window: already open");
        return true;
    }

    unsigned int flags = 0;
    if (config.vsync)     flags |= FLAG_VSYNC_HINT;
    if (config.antialias) flags |= FLAG_MSAA_4X_HINT;
    SetConfigFlags(flags);

    // Raylib's own chatter below warnings would drown the frame log
    SetTraceLogLevel(LOG_WARNING);
    InitWindow(config.width, config.height, config.title.c_str());
    if (!IsWindowReady()) {
        RENDER_LOG_ERROR("Window: could not open {}x{} '{}'", config.width, config.height, config.title);
        return false;
    }

    SetTargetFPS(config.targetFPS > 0 ? config.targetFPS : 0);
    m_width = GetScreenWidth();
    m_height = GetScreenHeight();
    m_open = true;
    return true;
}

void Window::close() {
    if (!m_open) return;
    CloseWindow();
    m_open = false;
}

bool Window::closeRequested() const {
    return m_open && WindowShouldClose();
}

void Window::setTitle(const std::string& title) {
    if (m_open) {
        SetWindowTitle(title.c_str());
    }
}

} // namespace orrery
