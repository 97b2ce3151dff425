#pragma once

#include "physics/System.hpp"
#include "physics/Vec2d.hpp"

namespace orrery {

/// Conserved quantities of a closed system. Forward Euler keeps total
/// momentum to rounding error but lets energy and angular momentum drift,
/// so these are the natural health checks for a run.
struct ConservedQuantities {
    double kineticEnergy   = 0.0;  ///< J
    double potentialEnergy = 0.0;  ///< J, pairwise -G m_i m_j / r_ij
    Vec2d  momentum;               ///< kg m/s
    double angularMomentum = 0.0;  ///< kg m^2/s, z component about the origin

    double totalEnergy() const { return kineticEnergy + potentialEnergy; }
};

/// Sum of m * v over all bodies.
Vec2d totalMomentum(const System& system);

/// Kinetic plus pairwise gravitational potential energy.
double totalEnergy(const System& system);

/// z component of sum of x cross (m * v), about the origin.
double totalAngularMomentum(const System& system);

/// Mass-weighted mean position.
Vec2d centerOfMass(const System& system);

ConservedQuantities measure(const System& system);

/// |(after - before) / before|, or |after - before| when `before` is zero.
double relativeDrift(double before, double after);

} // namespace orrery
