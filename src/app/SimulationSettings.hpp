#pragma once

#include "engine/Config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace orrery {

enum class RenderMode {
    Gif,      ///< Encode frames into an animated GIF
    Window,   ///< Live Raylib viewer
    None,     ///< Integrate only
};

/// Everything the driver reads from configuration, with defaults matching
/// a 1000-day solar-system run at one-minute steps.
struct SimulationSettings {
    // Integration
    double   timeStep      = 60.0;     ///< s
    double   durationDays  = 1000.0;
    uint64_t stepsPerFrame = 5000;

    // Initial state
    std::string ephemerisSource = "builtin";   ///< "builtin" or "file"
    std::string ephemerisFile;
    std::string epoch           = "2022-01-01 00:00:00";
    bool        fallbackBuiltin = false;
    std::vector<std::string> bodyNames;

    // Output
    RenderMode  renderMode       = RenderMode::Gif;
    std::string outputPath       = "simulation.gif";
    int         width            = 800;
    int         height           = 800;
    double      canvasSize       = 250e9;      ///< Half extent of the view, m
    double      bodyScale        = 250.0;
    int         frameDelay       = 2;          ///< GIF delay, 1/100 s
    int         targetFPS        = 60;
    bool        showFps          = false;      ///< FPS counter in the live window
    int         progressInterval = 10;         ///< Frames between progress lines

    static SimulationSettings fromConfig(const Config& config);

    /// Check ranges, returns list of errors (empty = valid).
    std::vector<std::string> validate() const;

    /// floor(duration / timeStep), or 0 when that does not fit in 64 bits
    uint64_t numSteps() const;

    /// floor(numSteps / stepsPerFrame)
    uint64_t numFrames() const;

    static const char* renderModeName(RenderMode mode);
};

} // namespace orrery
