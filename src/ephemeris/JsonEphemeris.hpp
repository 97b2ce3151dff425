#pragma once

#include "ephemeris/Ephemeris.hpp"

#include <map>
#include <nlohmann/json.hpp>

namespace orrery {

/// Ephemeris table loaded from JSON.
///
/// Layout:
/// {
///   "units": {"length": "au" | "km" | "m", "time": "day" | "s"},
///   "epochs": {
///     "2022-01-01 00:00:00": {
///       "earth": {"x": .., "y": .., "vx": .., "vy": ..,
///                 "radius": .., "mass": .., "color": "blue"}
///     }
///   }
/// }
///
/// Positions use the length unit, velocities length per time unit. Radius is
/// in km when the length unit is au or km (the usual ephemeris convention)
/// and in metres otherwise. Mass is always kg. Everything is converted to SI
/// at load time.
class JsonEphemeris : public IEphemerisProvider {
public:
    /// Parse a table. Returns nullopt, after logging, if the units are unknown
    /// or any entry lacks a numeric x, y, vx, vy or mass.
    static std::optional<JsonEphemeris> fromJson(const nlohmann::json& json,
                                                 const std::string& source = "<json>");

    /// Read and parse a table file.
    static std::optional<JsonEphemeris> fromFile(const std::string& path);

    std::optional<Body> lookup(const std::string& name,
                               const std::string& epoch) const override;
    std::string describe() const override { return "ephemeris table '" + m_source + "'"; }

    /// Epoch keys present in the table, sorted.
    std::vector<std::string> epochs() const;

    /// Metres per length unit, or nullopt for an unknown unit name.
    static std::optional<double> lengthFactor(const std::string& unit);

    /// Seconds per time unit, or nullopt for an unknown unit name.
    static std::optional<double> timeFactor(const std::string& unit);

private:
    std::string m_source;
    std::map<std::string, std::map<std::string, Body>> m_table;
};

} // namespace orrery
