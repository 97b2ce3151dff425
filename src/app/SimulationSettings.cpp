#include "app/SimulationSettings.hpp"
#include "ephemeris/BuiltinEphemeris.hpp"
#include "physics/Constants.hpp"
#include "engine/Log.hpp"

#include <cmath>
#include <limits>

namespace orrery {

namespace {

// 2^64 as a double; any step quotient at or above it does not fit uint64_t
constexpr double kStepLimit = static_cast<double>(std::numeric_limits<uint64_t>::max());

double stepQuotient(double durationDays, double timeStep) {
    return std::floor(durationDays * DAY / timeStep);
}

} // namespace

SimulationSettings SimulationSettings::fromConfig(const Config& config) {
    SimulationSettings s;

    s.timeStep     = config.getDouble("simulation.time_step", s.timeStep);
    s.durationDays = config.getDouble("simulation.duration_days", s.durationDays);

    int stepsPerFrame = config.getInt("simulation.steps_per_frame", static_cast<int>(s.stepsPerFrame));
    s.stepsPerFrame = stepsPerFrame > 0 ? static_cast<uint64_t>(stepsPerFrame) : 0;

    s.ephemerisSource = config.getString("ephemeris.source", s.ephemerisSource);
    s.ephemerisFile   = config.getString("ephemeris.file", s.ephemerisFile);
    s.epoch           = config.getString("ephemeris.epoch", s.epoch);
    s.fallbackBuiltin = config.getBool("ephemeris.fallback_builtin", s.fallbackBuiltin);
    s.bodyNames       = config.getStringList("ephemeris.bodies", BuiltinEphemeris::defaultBodyNames());

    std::string mode = config.getString("render.mode", "gif");
    if (mode == "window")     s.renderMode = RenderMode::Window;
    else if (mode == "none")  s.renderMode = RenderMode::None;
    else if (mode == "gif")   s.renderMode = RenderMode::Gif;
    else {
        LOG_WARN("Unknown render.mode '{}', using gif", mode);
        s.renderMode = RenderMode::Gif;
    }

    s.outputPath       = config.getString("render.output", s.outputPath);
    s.width            = config.getInt("render.width", s.width);
    s.height           = config.getInt("render.height", s.height);
    s.canvasSize       = config.getDouble("render.canvas_size", s.canvasSize);
    s.bodyScale        = config.getDouble("render.body_scale", s.bodyScale);
    s.frameDelay       = config.getInt("render.frame_delay", s.frameDelay);
    s.targetFPS        = config.getInt("render.target_fps", s.targetFPS);
    s.showFps          = config.getBool("render.show_fps", s.showFps);
    s.progressInterval = config.getInt("render.progress_interval", s.progressInterval);

    return s;
}

std::vector<std::string> SimulationSettings::validate() const {
    std::vector<std::string> errors;

    if (!std::isfinite(timeStep) || timeStep <= 0.0) {
        errors.push_back("simulation.time_step must be a positive number of seconds");
    }
    if (!std::isfinite(durationDays) || durationDays <= 0.0) {
        errors.push_back("simulation.duration_days must be positive");
    }
    if (stepsPerFrame == 0) {
        errors.push_back("simulation.steps_per_frame must be at least 1");
    }
    if (ephemerisSource != "builtin" && ephemerisSource != "file") {
        errors.push_back("ephemeris.source must be 'builtin' or 'file' (got '" + ephemerisSource + "')");
    }
    if (ephemerisSource == "file" && ephemerisFile.empty()) {
        errors.push_back("ephemeris.file is required when ephemeris.source is 'file'");
    }
    if (bodyNames.empty()) {
        errors.push_back("ephemeris.bodies is empty");
    }
    if (width <= 0 || height <= 0) {
        errors.push_back("render.width and render.height must be positive");
    }
    if (!std::isfinite(canvasSize) || canvasSize <= 0.0) {
        errors.push_back("render.canvas_size must be positive");
    }
    if (!std::isfinite(bodyScale) || bodyScale < 0.0) {
        errors.push_back("render.body_scale must not be negative");
    }
    if (frameDelay < 0) {
        errors.push_back("render.frame_delay must not be negative");
    }
    if (renderMode == RenderMode::Gif && outputPath.empty()) {
        errors.push_back("render.output is required in gif mode");
    }
    if (progressInterval <= 0) {
        errors.push_back("render.progress_interval must be at least 1");
    }
    if (errors.empty() && !(stepQuotient(durationDays, timeStep) < kStepLimit)) {
        errors.push_back("simulation.duration_days / simulation.time_step gives too many steps to count");
    }
    if (errors.empty() && numFrames() == 0) {
        errors.push_back("simulation is shorter than one frame (duration / time_step < steps_per_frame)");
    }
    return errors;
}

uint64_t SimulationSettings::numSteps() const {
    if (!(timeStep > 0.0) || !(durationDays > 0.0)) return 0;
    double steps = stepQuotient(durationDays, timeStep);
    if (!(steps < kStepLimit)) return 0;
    return static_cast<uint64_t>(steps);
}

uint64_t SimulationSettings::numFrames() const {
    if (stepsPerFrame == 0) return 0;
    return numSteps() / stepsPerFrame;
}

const char* SimulationSettings::renderModeName(RenderMode mode) {
    switch (mode) {
        case RenderMode::Gif:    return "gif";
        case RenderMode::Window: return "window";
        case RenderMode::None:   return "none";
    }
    return "?";
}

} // namespace orrery
