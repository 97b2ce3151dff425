#include "app/Simulation.hpp"
#include "ephemeris/BuiltinEphemeris.hpp"
#include "ephemeris/JsonEphemeris.hpp"
#include "physics/Constants.hpp"
#include "rendering/GifRenderer.hpp"
#include "rendering/RaylibRenderer.hpp"
#include "engine/Log.hpp"

#include <csignal>
#include <filesystem>

namespace orrery {

std::atomic<bool> Simulation::s_signalReceived{false};

void Simulation::signalHandler(int signum) {
    // Signal-safe: only set an atomic flag. The frame loop checks it.
    (void)signum;
    s_signalReceived.store(true, std::memory_order_relaxed);
}

bool Simulation::init(const std::string& configPath, const std::vector<std::string>& overrides) {
    bool loaded = m_config.loadFromFile(configPath);

    // "config.json" -> "config.local.json"
    namespace fs = std::filesystem;
    fs::path base(configPath);
    fs::path localFile = base.parent_path()
        / (base.stem().string() + ".local" + base.extension().string());
    bool merged = m_config.mergeFromFile(localFile.string());

    std::vector<std::string> rejected;
    for (const auto& assignment : overrides) {
        if (!m_config.applyOverride(assignment)) {
            rejected.push_back(assignment);
        }
    }

    Log::init(m_config.getString("logging.file", ""),
              m_config.getString("logging.level", "info"));

    if (loaded) {
        LOG_INFO("Configuration loaded from '{}'", configPath);
    } else {
        LOG_WARN("Could not load config from '{}', using defaults", configPath);
    }
    if (merged) {
        LOG_INFO("Local overrides merged from '{}'", localFile.string());
    }
    for (const auto& assignment : rejected) {
        LOG_WARN("Ignoring malformed override '{}' (expected key=value)", assignment);
    }

    return setup();
}

bool Simulation::init(const Config& config) {
    m_config = config;
    return setup();
}

bool Simulation::setup() {
    LOG_INFO("Orrery v{} starting...", kOrreryVersion);

    m_settings = SimulationSettings::fromConfig(m_config);
    auto errors = m_settings.validate();
    for (const auto& error : errors) {
        LOG_ERROR("Config: {}", error);
    }
    if (!errors.empty()) {
        return false;
    }

    auto provider = makeProvider();
    if (!provider) {
        return false;
    }
    LOG_INFO("Loading {} bodies at epoch '{}' from {}",
             m_settings.bodyNames.size(), m_settings.epoch, provider->describe());

    auto bodies = loadBodies(*provider, m_settings.bodyNames, m_settings.epoch);
    if (!bodies) {
        LOG_CRITICAL("Initial state incomplete, refusing to simulate");
        return false;
    }

    m_system = System::create(std::move(*bodies), m_settings.timeStep);
    if (!m_system) {
        LOG_CRITICAL("Invalid initial state, refusing to simulate");
        return false;
    }

    m_initial = measure(*m_system);
    LOG_INFO("System ready: {} bodies, dt={} s, {} steps in {} frames of {} steps",
             m_system->size(), m_settings.timeStep, m_settings.numSteps(),
             m_settings.numFrames(), m_settings.stepsPerFrame);

    LOG_INFO("Render mode: {}", SimulationSettings::renderModeName(m_settings.renderMode));
    if (!createRenderer()) {
        return false;
    }

    m_camera = Camera(static_cast<float>(m_settings.width), static_cast<float>(m_settings.height),
                      m_settings.canvasSize);
    m_systemRenderer.getConfig().bodyScale = m_settings.bodyScale;
    m_systemRenderer.setRenderer(m_renderer.get());
    m_systemRenderer.setCamera(&m_camera);

    return true;
}

std::unique_ptr<IEphemerisProvider> Simulation::makeProvider() const {
    if (m_settings.ephemerisSource == "builtin") {
        return std::make_unique<BuiltinEphemeris>();
    }

    auto table = JsonEphemeris::fromFile(m_settings.ephemerisFile);
    if (!table) {
        LOG_CRITICAL("Could not load ephemeris table '{}'", m_settings.ephemerisFile);
        return nullptr;
    }

    auto file = std::make_unique<JsonEphemeris>(std::move(*table));
    if (m_settings.fallbackBuiltin) {
        return std::make_unique<LayeredEphemeris>(std::move(file),
                                                  std::make_unique<BuiltinEphemeris>());
    }
    return file;
}

bool Simulation::createRenderer() {
    if (!m_renderer) {
        switch (m_settings.renderMode) {
            case RenderMode::Gif: {
                GifConfig gif;
                gif.outputPath = m_settings.outputPath;
                gif.frameDelay = m_settings.frameDelay;
                m_renderer = std::make_unique<GifRenderer>(gif);
                break;
            }
            case RenderMode::Window: {
                WindowConfig win;
                win.title = std::string("Orrery v") + kOrreryVersion;
                win.targetFPS = m_settings.targetFPS;
                m_renderer = std::make_unique<RaylibRenderer>(win, m_settings.showFps);
                break;
            }
            case RenderMode::None:
                LOG_INFO("Rendering disabled");
                return true;
        }
    }

    if (!m_renderer->init(m_settings.width, m_settings.height)) {
        LOG_CRITICAL("Failed to initialize {} renderer", m_renderer->name());
        m_renderer.reset();
        return false;
    }
    return true;
}

bool Simulation::run() {
    if (!m_system) {
        LOG_ERROR("Simulation::run called before a successful init");
        return false;
    }

    s_signalReceived.store(false, std::memory_order_relaxed);
    std::signal(SIGTERM, Simulation::signalHandler);
    std::signal(SIGINT, Simulation::signalHandler);

    const uint64_t frames = m_settings.numFrames();
    const uint64_t progressEvery = static_cast<uint64_t>(m_settings.progressInterval);
    logQuantities("Initial", m_initial);

    for (uint64_t frame = 0; frame < frames; ++frame) {
        if (s_signalReceived.load(std::memory_order_relaxed)) {
            LOG_WARN("Termination signal received, stopping after {} frames", m_framesCompleted);
            break;
        }
        if (m_stopRequested || (m_renderer && m_renderer->shouldClose())) {
            LOG_INFO("Stopped after {} frames", m_framesCompleted);
            break;
        }

        m_profiler.beginFrame();
        {
            auto zone = m_profiler.scopedZone("Integrate");
            m_system->advance(m_settings.stepsPerFrame);
        }
        if (m_renderer) {
            auto zone = m_profiler.scopedZone("Render");
            m_systemRenderer.drawFrame(*m_system);
        }
        m_profiler.endFrame();
        ++m_framesCompleted;

        if (m_framesCompleted % progressEvery == 0 || m_framesCompleted == frames) {
            LOG_INFO("Frame {}/{} ({})", m_framesCompleted, frames,
                     SystemRenderer::timeLabel(m_system->t()));
        }
    }

    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGINT, SIG_DFL);

    ConservedQuantities last = measure(*m_system);
    logQuantities("Final", last);
    LOG_INFO("Relative energy drift {:.3e}, angular momentum drift {:.3e}",
             relativeDrift(m_initial.totalEnergy(), last.totalEnergy()),
             relativeDrift(m_initial.angularMomentum, last.angularMomentum));

    bool ok = true;
    if (m_renderer) {
        auto zone = m_profiler.scopedZone("Encode");
        ok = m_renderer->finish();
    }
    m_profiler.logSummary();

    const auto integrate = m_profiler.getZoneStats("Integrate");
    if (integrate.totalMs > 0.0) {
        LOG_INFO("Integrated {} steps at {:.0f} steps/s", m_system->stepCount(),
                 static_cast<double>(m_system->stepCount()) / (integrate.totalMs / 1000.0));
    }
    return ok;
}

void Simulation::shutdown() {
    LOG_INFO("Shutting down...");
    if (m_renderer) {
        m_renderer->shutdown();
        m_renderer.reset();
    }
    m_systemRenderer.setRenderer(nullptr);
}

void Simulation::logQuantities(const char* label, const ConservedQuantities& q) const {
    Vec2d com = centerOfMass(*m_system);
    LOG_INFO("{} state: t={:.0f} s, E={:.6e} J, p=({:.6e}, {:.6e}) kg m/s, L={:.6e} kg m^2/s",
             label, m_system->t(), q.totalEnergy(), q.momentum.x, q.momentum.y, q.angularMomentum);
    LOG_DEBUG("{} centre of mass: ({:.6e}, {:.6e}) m", label, com.x, com.y);
}

} // namespace orrery
