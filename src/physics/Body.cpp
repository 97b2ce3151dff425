#include "physics/Body.hpp"
#include "physics/Constants.hpp"

#include <cmath>

namespace orrery {

Vec2d Body::forceFrom(const Body& other) const {
    Vec2d d = x - other.x;
    double dist = d.length();
    return d * (-G * m * other.m / (dist * dist * dist));
}

Vec2d Body::force(std::span<const Body* const> others) const {
    Vec2d total;
    for (const Body* other : others) {
        total += forceFrom(*other);
    }
    return total;
}

std::vector<std::string> Body::validate() const {
    std::vector<std::string> errors;
    const std::string label = name.empty() ? std::string("<unnamed>") : name;

    if (name.empty()) {
        errors.push_back("Body name is empty");
    }
    if (!std::isfinite(m) || m <= 0.0) {
        errors.push_back("Body '" + label + "' has non-positive or non-finite mass");
    }
    if (!std::isfinite(r) || r < 0.0) {
        errors.push_back("Body '" + label + "' has negative or non-finite radius");
    }
    if (!x.isFinite()) {
        errors.push_back("Body '" + label + "' has a non-finite position");
    }
    if (!v.isFinite()) {
        errors.push_back("Body '" + label + "' has a non-finite velocity");
    }
    return errors;
}

} // namespace orrery
