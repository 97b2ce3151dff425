#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace orrery {

/// Wall-clock samples for one named zone, in milliseconds.
struct ZoneStats {
    std::string name;
    uint64_t samples = 0;
    double lastMs  = 0.0;
    double totalMs = 0.0;
    double minMs   = 0.0;
    double maxMs   = 0.0;

    double meanMs() const { return samples > 0 ? totalMs / static_cast<double>(samples) : 0.0; }
    void record(double ms);
};

/// Times the phases of the frame loop.
///
///   profiler.beginFrame();
///   { auto z = profiler.scopedZone("Integrate"); system.advance(n); }
///   { auto z = profiler.scopedZone("Render");    draw(system); }
///   profiler.endFrame();
///
/// A handful of zones is expected, so lookups are linear.
class Profiler {
public:
    class ScopedZone {
    public:
        ScopedZone(Profiler& profiler, const char* name) : m_profiler(profiler), m_name(name) {
            m_profiler.beginZone(m_name);
        }
        ~ScopedZone() { m_profiler.endZone(m_name); }

        ScopedZone(const ScopedZone&) = delete;
        ScopedZone& operator=(const ScopedZone&) = delete;

    private:
        Profiler& m_profiler;
        const char* m_name;
    };

    void beginFrame();
    void endFrame();

    /// Starting a zone that is already running restarts it.
    void beginZone(std::string_view name);
    /// Ending a zone that is not running does nothing.
    void endZone(std::string_view name);

    ScopedZone scopedZone(const char* name) { return ScopedZone(*this, name); }

    /// Copy of the zone's stats; zero samples if it never ran.
    ZoneStats getZoneStats(std::string_view name) const;

    /// Zones in the order they first completed.
    const std::vector<ZoneStats>& getAllZoneStats() const { return m_zones; }

    /// Whole-frame timing, beginFrame to endFrame.
    const ZoneStats& frameStats() const { return m_frame; }
    uint64_t frameCount() const { return m_frame.samples; }

    /// One info line per zone with its share of total frame time.
    void logSummary() const;

    void reset();

private:
    using Clock = std::chrono::steady_clock;

    struct Running {
        std::string name;
        Clock::time_point start;
    };

    static double elapsedMs(Clock::time_point since);

    ZoneStats m_frame{"Frame"};
    Clock::time_point m_frameStart;
    std::vector<Running> m_running;
    std::vector<ZoneStats> m_zones;
};

} // namespace orrery
