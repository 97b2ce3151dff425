#include "ephemeris/BuiltinEphemeris.hpp"

namespace orrery {

namespace {

Body makeBody(const char* name, const char* color, double distance, double speed,
              double radius, double mass) {
    Body body;
    body.name = name;
    body.color = color;
    body.x = {0.0, distance};
    body.v = {speed, 0.0};
    body.r = radius;
    body.m = mass;
    return body;
}

} // namespace

const std::vector<Body>& BuiltinEphemeris::catalog() {
    //                                     distance (m)      speed (m/s)  radius (m)   mass (kg)
    static const std::vector<Body> bodies = {
        makeBody("sun",     "yellow", 0.0,               0.0,     696340e3,    1.989e30),
        makeBody("mercury", "grey",   57909175e3,        47000.0, 2439.7e3,    3.285e23),
        makeBody("venus",   "orange", 108208930e3,       35000.0, 6051.8e3,    4.867e24),
        makeBody("earth",   "blue",   149598261e3,       30000.0, 6371e3,      5.972e24),
        makeBody("mars",    "red",    227939100e3,       24000.0, 3389.5e3,    6.39e23),
        makeBody("jupiter", "orange", 778547200e3,       13000.0, 69911e3,     1.898e27),
        makeBody("saturn",  "yellow", 1433449370e3,      9000.0,  58232e3,     5.683e26),
        makeBody("uranus",  "cyan",   2876679082e3,      6835.0,  25362e3,     8.681e25),
        makeBody("neptune", "blue",   4503443661e3,      5477.0,  24622e3,     1.024e26),
        makeBody("pluto",   "grey",   5913520000e3,      4748.0,  1188.3e3,    1.303e22),
    };
    return bodies;
}

std::vector<std::string> BuiltinEphemeris::defaultBodyNames() {
    std::vector<std::string> names;
    for (const auto& body : catalog()) {
        names.push_back(body.name);
    }
    return names;
}

std::optional<Body> BuiltinEphemeris::lookup(const std::string& name,
                                             const std::string& /*epoch*/) const {
    for (const auto& body : catalog()) {
        if (body.name == name) {
            return body;
        }
    }
    return std::nullopt;
}

} // namespace orrery
