#include "engine/Profiler.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <iterator>

namespace orrery {

void ZoneStats::record(double ms) {
    minMs = samples == 0 ? ms : std::min(minMs, ms);
    maxMs = samples == 0 ? ms : std::max(maxMs, ms);
    lastMs = ms;
    totalMs += ms;
    ++samples;
}

double Profiler::elapsedMs(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

void Profiler::beginFrame() {
    m_frameStart = Clock::now();
}

void Profiler::endFrame() {
    m_frame.record(elapsedMs(m_frameStart));
}

void Profiler::beginZone(std::string_view name) {
    auto it = std::find_if(m_running.begin(), m_running.end(),
                           [&](const Running& r) { return r.name == name; });
    if (it != m_running.end()) {
        it->start = Clock::now();
        return;
    }
    m_running.push_back(Running{std::string(name), Clock::now()});
}

void Profiler::endZone(std::string_view name) {
    auto it = std::find_if(m_running.begin(), m_running.end(),
                           [&](const Running& r) { return r.name == name; });
    if (it == m_running.end()) return;

    double ms = elapsedMs(it->start);
    m_running.erase(it);

    auto zone = std::find_if(m_zones.begin(), m_zones.end(),
                             [&](const ZoneStats& z) { return z.name == name; });
    if (zone == m_zones.end()) {
        m_zones.push_back(ZoneStats{std::string(name)});
        zone = std::prev(m_zones.end());
    }
    zone->record(ms);
}

ZoneStats Profiler::getZoneStats(std::string_view name) const {
    for (const auto& zone : m_zones) {
        if (zone.name == name) return zone;
    }
    return ZoneStats{std::string(name)};
}

void Profiler::logSummary() const {
    LOG_INFO("Profiler: {} frames, {:.1f} ms total, {:.3f} ms mean", m_frame.samples,
             m_frame.totalMs, m_frame.meanMs());
    for (const auto& zone : m_zones) {
        double share = m_frame.totalMs > 0.0 ? 100.0 * zone.totalMs / m_frame.totalMs : 0.0;
        LOG_INFO("  {:<10} {:>10.1f} ms {:>5.1f}%  mean {:.3f}  min {:.3f}  max {:.3f}",
                 zone.name, zone.totalMs, share, zone.meanMs(), zone.minMs, zone.maxMs);
    }
}

void Profiler::reset() {
    m_frame = ZoneStats{"Frame"};
    m_running.clear();
    m_zones.clear();
}

} // namespace orrery
