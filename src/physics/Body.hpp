#pragma once

#include "physics/Vec2d.hpp"

#include <span>
#include <string>
#include <vector>

namespace orrery {

/// One gravitating point mass.
///
/// `r` and `color` only affect rendering; the force law treats every body as a
/// point at `x`. All quantities are SI: metres, metres/second, kilograms.
struct Body {
    std::string name;
    std::string color = "white";

    Vec2d x;            ///< Position (m)
    Vec2d v;            ///< Velocity (m/s)
    double r = 0.0;     ///< Physical radius (m)
    double m = 0.0;     ///< Mass (kg), must be > 0

    /// Newtonian attraction exerted on this body by `other`.
    /// Undefined when both bodies occupy the same position.
    Vec2d forceFrom(const Body& other) const;

    /// Net force from every body in `others`. `others` must not contain this
    /// body. An empty set yields the zero vector.
    Vec2d force(std::span<const Body* const> others) const;

    Vec2d momentum() const { return v * m; }
    double kineticEnergy() const { return 0.5 * m * v.lengthSquared(); }

    /// Check the physical invariants, returns list of errors (empty = valid).
    std::vector<std::string> validate() const;
};

} // namespace orrery
