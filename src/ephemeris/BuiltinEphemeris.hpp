#pragma once

#include "ephemeris/Ephemeris.hpp"

namespace orrery {

/// Literal constants for the Sun, the eight planets and Pluto.
///
/// Planets start on the +y axis at their mean orbital distance moving in +x,
/// i.e. clockwise circular-ish orbits about a Sun at rest at the origin.
/// The same states are served for every epoch.
class BuiltinEphemeris : public IEphemerisProvider {
public:
    std::optional<Body> lookup(const std::string& name,
                               const std::string& epoch) const override;
    std::string describe() const override { return "built-in constants"; }

    /// All built-in bodies, Sun first then outward.
    static const std::vector<Body>& catalog();

    /// Names of catalog() in order.
    static std::vector<std::string> defaultBodyNames();
};

} // namespace orrery
