#pragma once

#include <cstdint>
#include <string>

namespace orrery {

/// 8-bit RGBA colour.
struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    static constexpr Color White() { return {255, 255, 255, 255}; }
    static constexpr Color Black() { return {0, 0, 0, 255}; }
};

/// Pixel coordinates, origin top-left, y down.
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    bool operator==(const Vec2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }
};

/// Frame sink for the simulation. One frame is
/// beginFrame, clear, any number of draw calls, endFrame.
class IRenderer {
public:
    virtual ~IRenderer() = default;

    /// Prepare a `screenWidth` x `screenHeight` pixel target.
    virtual bool init(int screenWidth, int screenHeight) = 0;
    virtual void shutdown() = 0;

    virtual void beginFrame() = 0;
    /// Present (window) or store (file) the frame.
    virtual void endFrame() = 0;

    virtual void clear(const Color& color) = 0;

    virtual int getScreenWidth() const = 0;
    virtual int getScreenHeight() const = 0;

    virtual void drawCircle(Vec2 center, float radius, const Color& color) = 0;

    /// `position` is the top-left corner of the text box.
    virtual void drawText(const std::string& text, Vec2 position, int fontSize,
                          const Color& color) = 0;

    /// Called once after the last frame. File backends encode here and
    /// return false if the output could not be written.
    virtual bool finish() { return true; }

    /// The viewer was closed. Backends without a window never close.
    virtual bool shouldClose() const { return false; }

    virtual const char* name() const = 0;
};

} // namespace orrery
