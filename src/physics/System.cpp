#include "physics/System.hpp"
#include "engine/Log.hpp"

#include <cmath>
#include <unordered_set>

namespace orrery {

std::optional<System> System::create(std::vector<Body> bodies, double timeStep) {
    bool valid = true;

    if (bodies.empty()) {
        LOG_ERROR("System: no bodies to simulate");
        valid = false;
    }
    if (!std::isfinite(timeStep) || timeStep <= 0.0) {
        LOG_ERROR("System: time step must be positive and finite (got {})", timeStep);
        valid = false;
    }

    std::unordered_set<std::string> seen;
    for (const auto& body : bodies) {
        for (const auto& error : body.validate()) {
            LOG_ERROR("System: {}", error);
            valid = false;
        }
        if (!body.name.empty() && !seen.insert(body.name).second) {
            LOG_ERROR("System: duplicate body name '{}'", body.name);
            valid = false;
        }
    }

    // Coincident bodies make the force law divide by zero
    for (size_t i = 0; i < bodies.size(); ++i) {
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            if (bodies[i].x == bodies[j].x) {
                LOG_ERROR("System: bodies '{}' and '{}' share position ({}, {})",
                          bodies[i].name, bodies[j].name, bodies[i].x.x, bodies[i].x.y);
                valid = false;
            }
        }
    }

    if (!valid) {
        return std::nullopt;
    }
    return System(std::move(bodies), timeStep);
}

System::System(std::vector<Body> bodies, double timeStep)
    : m_bodies(std::move(bodies)), m_timeStep(timeStep) {
    m_index.reserve(m_bodies.size());
    for (size_t i = 0; i < m_bodies.size(); ++i) {
        m_index.emplace(m_bodies[i].name, i);
    }
    m_next.resize(m_bodies.size());
    m_others.reserve(m_bodies.size());
}

void System::step() {
    const size_t n = m_bodies.size();

    // Compute phase: read only the committed state
    for (size_t i = 0; i < n; ++i) {
        const Body& body = m_bodies[i];

        m_others.clear();
        for (size_t j = 0; j < n; ++j) {
            if (j != i) m_others.push_back(&m_bodies[j]);
        }

        m_next[i].x = body.x + body.v * m_timeStep;
        m_next[i].v = body.v + body.force(m_others) * m_timeStep / body.m;
    }

    // Commit phase
    for (size_t i = 0; i < n; ++i) {
        m_bodies[i].x = m_next[i].x;
        m_bodies[i].v = m_next[i].v;
    }

    ++m_stepCount;
    // Derived from the step count so rounding does not accumulate
    m_time = static_cast<double>(m_stepCount) * m_timeStep;
}

void System::advance(uint64_t steps) {
    for (uint64_t i = 0; i < steps; ++i) {
        step();
    }
}

const Body* System::find(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) return nullptr;
    return &m_bodies[it->second];
}

std::vector<BodySnapshot> System::positions() const {
    std::vector<BodySnapshot> out;
    out.reserve(m_bodies.size());
    for (const auto& body : m_bodies) {
        out.push_back({body.name, body.color, body.x, body.r});
    }
    return out;
}

} // namespace orrery
