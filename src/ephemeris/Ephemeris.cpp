#include "ephemeris/Ephemeris.hpp"
#include "engine/Log.hpp"

namespace orrery {

std::optional<Body> LayeredEphemeris::lookup(const std::string& name,
                                             const std::string& epoch) const {
    if (m_primary) {
        if (auto body = m_primary->lookup(name, epoch)) {
            return body;
        }
    }
    if (m_fallback) {
        if (auto body = m_fallback->lookup(name, epoch)) {
            LOG_DEBUG("Ephemeris: '{}' not in {}, using {}", name,
                      m_primary ? m_primary->describe() : "primary", m_fallback->describe());
            return body;
        }
    }
    return std::nullopt;
}

std::string LayeredEphemeris::describe() const {
    std::string primary = m_primary ? m_primary->describe() : "none";
    std::string fallback = m_fallback ? m_fallback->describe() : "none";
    return primary + " over " + fallback;
}

std::optional<std::vector<Body>> loadBodies(const IEphemerisProvider& provider,
                                            const std::vector<std::string>& names,
                                            const std::string& epoch) {
    std::vector<Body> bodies;
    bodies.reserve(names.size());
    bool complete = true;

    for (const auto& name : names) {
        auto body = provider.lookup(name, epoch);
        if (!body) {
            LOG_ERROR("Ephemeris: no data for '{}' at epoch '{}' from {}",
                      name, epoch, provider.describe());
            complete = false;
            continue;
        }
        LOG_DEBUG("Ephemeris: {} x=({:.6e}, {:.6e}) m v=({:.6e}, {:.6e}) m/s m={:.4e} kg",
                  body->name, body->x.x, body->x.y, body->v.x, body->v.y, body->m);
        bodies.push_back(std::move(*body));
    }

    if (!complete) {
        return std::nullopt;
    }
    return bodies;
}

} // namespace orrery
