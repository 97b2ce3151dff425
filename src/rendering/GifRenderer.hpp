#pragma once

#include "rendering/IRenderer.hpp"

#include <Magick++.h>

#include <string>
#include <vector>

namespace orrery {

struct GifConfig {
    std::string outputPath = "simulation.gif";
    int frameDelay = 2;        ///< Delay between frames in 1/100 s
    int loopCount  = 0;        ///< 0 = loop forever
};

/// Off-screen backend that collects frames with Magick++ and encodes them
/// as one animated GIF in finish().
class GifRenderer : public IRenderer {
public:
    explicit GifRenderer(GifConfig config = GifConfig());

    bool init(int screenWidth, int screenHeight) override;
    void shutdown() override;

    void beginFrame() override;
    void endFrame() override;

    void clear(const Color& color) override;

    int getScreenWidth() const override { return m_screenWidth; }
    int getScreenHeight() const override { return m_screenHeight; }

    void drawCircle(Vec2 center, float radius, const Color& color) override;
    void drawText(const std::string& text, Vec2 position, int fontSize,
                  const Color& color) override;

    /// Write all collected frames to the output path.
    bool finish() override;

    const char* name() const override { return "gif"; }

    size_t frameCount() const { return m_frames.size(); }
    const GifConfig& getConfig() const { return m_config; }

    /// "#rrggbb" / "#rrggbbaa" form accepted by Magick::Color.
    static std::string toHex(const Color& color);

private:
    GifConfig m_config;

    int m_screenWidth = 0;
    int m_screenHeight = 0;
    bool m_initialized = false;
    bool m_inFrame = false;
    bool m_textFailed = false;

    Magick::Image m_current;
    std::vector<Magick::Image> m_frames;
};

} // namespace orrery
