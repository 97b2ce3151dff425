#pragma once

#include <string>

namespace orrery {

struct WindowConfig {
    int         width       = 800;
    int         height      = 800;
    std::string title       = "Orrery";
    bool        vsync       = true;
    bool        antialias   = true;   ///< 4x MSAA, smooths small markers
    int         targetFPS   = 60;     ///< 0 = uncapped
};

/// Owns the single Raylib window of the live viewer. Raylib keeps the window
/// in global state, so at most one Window may be open at a time.
class Window {
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool open(const WindowConfig& config);
    void close();

    bool isOpen() const { return m_open; }

    /// The user clicked close or pressed Escape.
    bool closeRequested() const;

    int width() const { return m_width; }
    int height() const { return m_height; }

    void setTitle(const std::string& title);

private:
    bool m_open = false;
    int m_width = 0;
    int m_height = 0;
};

} // namespace orrery
