#pragma once

#include "physics/Body.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orrery {

/// Render-facing view of one body. Views borrow from the System and are
/// invalidated by the next step().
struct BodySnapshot {
    std::string_view name;
    std::string_view color;
    Vec2d x;
    double r = 0.0;
};

/// A fixed set of named bodies advanced with forward Euler.
///
/// Each step() evaluates every body against the pre-step state of all the
/// others, buffers the results, then commits them together. Updating bodies
/// one at a time in place would let later bodies see already-advanced
/// positions of earlier ones and break Newton's third law.
///
/// Forward Euler is first order and not symplectic: energy and angular
/// momentum drift over long runs. Keep the time step small against the
/// shortest orbital period in the set.
class System {
public:
    /// Build a system, or nullopt if the body set is empty, any body fails
    /// Body::validate(), two bodies share a name or a position, or the time
    /// step is not a positive finite number. Every problem found is logged.
    static std::optional<System> create(std::vector<Body> bodies, double timeStep);

    /// Advance all bodies and the clock by one time step.
    void step();

    /// Call step() `steps` times.
    void advance(uint64_t steps);

    /// Elapsed simulation time in seconds.
    double t() const { return m_time; }
    double timeStep() const { return m_timeStep; }
    uint64_t stepCount() const { return m_stepCount; }

    size_t size() const { return m_bodies.size(); }

    /// Bodies in insertion order.
    const std::vector<Body>& bodies() const { return m_bodies; }

    /// Look up a body by name, nullptr if absent.
    const Body* find(const std::string& name) const;

    /// Current name, position, radius and colour of every body, insertion order.
    std::vector<BodySnapshot> positions() const;

private:
    System(std::vector<Body> bodies, double timeStep);

    struct NextState {
        Vec2d x;
        Vec2d v;
    };

    std::vector<Body> m_bodies;
    std::unordered_map<std::string, size_t> m_index;

    // Compute-phase buffers, reused across steps
    std::vector<NextState> m_next;
    std::vector<const Body*> m_others;

    double   m_timeStep  = 0.0;
    double   m_time      = 0.0;
    uint64_t m_stepCount = 0;
};

} // namespace orrery
