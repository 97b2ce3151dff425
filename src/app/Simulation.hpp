#pragma once

#include "app/SimulationSettings.hpp"
#include "engine/Config.hpp"
#include "engine/Profiler.hpp"
#include "ephemeris/Ephemeris.hpp"
#include "physics/Diagnostics.hpp"
#include "physics/System.hpp"
#include "rendering/Camera.hpp"
#include "rendering/IRenderer.hpp"
#include "rendering/SystemRenderer.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace orrery {

/// Simulation version string.
inline constexpr const char* kOrreryVersion = "1.0.0";

/// Frame loop driver: builds the System from configuration, advances it
/// `steps_per_frame` steps per frame, and hands each frame to a renderer.
class Simulation {
public:
    /// Load `configPath` (defaults if unreadable), merge the sibling
    /// `<stem>.local<ext>` overlay, apply `key=value` overrides, start
    /// logging, then set up as init(const Config&).
    bool init(const std::string& configPath, const std::vector<std::string>& overrides = {});

    /// Set up from an already-built configuration. Logging is left as is.
    bool init(const Config& config);

    /// Run every frame (or until stopped). Returns false if the simulation
    /// was never initialized or the renderer failed to finalize its output.
    bool run();

    void shutdown();

    /// Stop after the current frame.
    void requestStop() { m_stopRequested = true; }

    /// Use `renderer` instead of the one render.mode would create.
    /// Must be called before init().
    void setRenderer(std::unique_ptr<IRenderer> renderer) { m_renderer = std::move(renderer); }

    const Config& getConfig() const { return m_config; }
    const SimulationSettings& getSettings() const { return m_settings; }
    const System* getSystem() const { return m_system ? &*m_system : nullptr; }
    const Profiler& getProfiler() const { return m_profiler; }
    IRenderer* getRenderer() { return m_renderer.get(); }
    const Camera& getCamera() const { return m_camera; }

    uint64_t framesCompleted() const { return m_framesCompleted; }
    const ConservedQuantities& initialQuantities() const { return m_initial; }

private:
    bool setup();
    std::unique_ptr<IEphemerisProvider> makeProvider() const;
    bool createRenderer();
    void logQuantities(const char* label, const ConservedQuantities& q) const;

    Config m_config;
    SimulationSettings m_settings;
    std::optional<System> m_system;

    std::unique_ptr<IRenderer> m_renderer;
    Camera m_camera;
    SystemRenderer m_systemRenderer;
    Profiler m_profiler;

    ConservedQuantities m_initial;
    uint64_t m_framesCompleted = 0;
    bool m_stopRequested = false;

    static std::atomic<bool> s_signalReceived;
    static void signalHandler(int signum);
};

} // namespace orrery
