#include "physics/Diagnostics.hpp"
#include "physics/Constants.hpp"

#include <cmath>

namespace orrery {

Vec2d totalMomentum(const System& system) {
    Vec2d p;
    for (const auto& body : system.bodies()) {
        p += body.momentum();
    }
    return p;
}

double totalEnergy(const System& system) {
    return measure(system).totalEnergy();
}

double totalAngularMomentum(const System& system) {
    double l = 0.0;
    for (const auto& body : system.bodies()) {
        l += Vec2d::cross(body.x, body.momentum());
    }
    return l;
}

Vec2d centerOfMass(const System& system) {
    Vec2d weighted;
    double mass = 0.0;
    for (const auto& body : system.bodies()) {
        weighted += body.x * body.m;
        mass += body.m;
    }
    return mass > 0.0 ? weighted / mass : Vec2d();
}

ConservedQuantities measure(const System& system) {
    ConservedQuantities q;
    const auto& bodies = system.bodies();

    for (size_t i = 0; i < bodies.size(); ++i) {
        q.kineticEnergy += bodies[i].kineticEnergy();
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            double dist = Vec2d::distance(bodies[i].x, bodies[j].x);
            q.potentialEnergy -= G * bodies[i].m * bodies[j].m / dist;
        }
    }
    q.momentum = totalMomentum(system);
    q.angularMomentum = totalAngularMomentum(system);
    return q;
}

double relativeDrift(double before, double after) {
    if (before == 0.0) {
        return std::abs(after - before);
    }
    return std::abs((after - before) / before);
}

} // namespace orrery
