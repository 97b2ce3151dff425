#include "ephemeris/JsonEphemeris.hpp"
#include "physics/Constants.hpp"
#include "engine/Log.hpp"

#include <fstream>

namespace orrery {

std::optional<double> JsonEphemeris::lengthFactor(const std::string& unit) {
    if (unit == "au") return AU;
    if (unit == "km") return 1e3;
    if (unit == "m")  return 1.0;
    return std::nullopt;
}

std::optional<double> JsonEphemeris::timeFactor(const std::string& unit) {
    if (unit == "day") return DAY;
    if (unit == "s")   return 1.0;
    return std::nullopt;
}

static bool readNumber(const nlohmann::json& entry, const char* field, double& out) {
    auto it = entry.find(field);
    if (it == entry.end() || !it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

static std::string readString(const nlohmann::json& entry, const char* field,
                              const std::string& defaultVal) {
    auto it = entry.find(field);
    if (it == entry.end() || !it->is_string()) {
        return defaultVal;
    }
    return it->get<std::string>();
}

std::optional<JsonEphemeris> JsonEphemeris::fromJson(const nlohmann::json& json,
                                                     const std::string& source) {
    if (!json.is_object()) {
        LOG_ERROR("JsonEphemeris: '{}' is not a JSON object", source);
        return std::nullopt;
    }

    std::string lengthUnit = "m";
    std::string timeUnit = "s";
    if (json.contains("units") && json["units"].is_object()) {
        lengthUnit = readString(json["units"], "length", lengthUnit);
        timeUnit = readString(json["units"], "time", timeUnit);
    }

    auto metres = lengthFactor(lengthUnit);
    auto seconds = timeFactor(timeUnit);
    if (!metres || !seconds) {
        LOG_ERROR("JsonEphemeris: '{}' uses unknown units (length '{}', time '{}')",
                  source, lengthUnit, timeUnit);
        return std::nullopt;
    }
    const double radiusFactor = (lengthUnit == "m") ? 1.0 : 1e3;
    const double speedFactor = *metres / *seconds;

    if (!json.contains("epochs") || !json["epochs"].is_object()) {
        LOG_ERROR("JsonEphemeris: '{}' has no 'epochs' object", source);
        return std::nullopt;
    }

    JsonEphemeris eph;
    eph.m_source = source;
    bool valid = true;

    for (auto epochIt = json["epochs"].begin(); epochIt != json["epochs"].end(); ++epochIt) {
        if (!epochIt->is_object()) {
            LOG_ERROR("JsonEphemeris: epoch '{}' in '{}' is not an object", epochIt.key(), source);
            valid = false;
            continue;
        }

        auto& bodies = eph.m_table[epochIt.key()];
        for (auto bodyIt = epochIt->begin(); bodyIt != epochIt->end(); ++bodyIt) {
            const auto& entry = *bodyIt;
            Body body;
            body.name = bodyIt.key();

            double x = 0.0, y = 0.0, vx = 0.0, vy = 0.0;
            if (!entry.is_object() ||
                !readNumber(entry, "x", x) || !readNumber(entry, "y", y) ||
                !readNumber(entry, "vx", vx) || !readNumber(entry, "vy", vy) ||
                !readNumber(entry, "mass", body.m)) {
                LOG_ERROR("JsonEphemeris: '{}' at '{}' in '{}' needs numeric x, y, vx, vy and mass",
                          body.name, epochIt.key(), source);
                valid = false;
                continue;
            }

            double radius = 0.0;
            readNumber(entry, "radius", radius);

            body.x = Vec2d(x, y) * *metres;
            body.v = Vec2d(vx, vy) * speedFactor;
            body.r = radius * radiusFactor;
            body.color = readString(entry, "color", "white");

            bodies[body.name] = std::move(body);
        }
    }

    if (!valid) {
        return std::nullopt;
    }

    LOG_DEBUG("JsonEphemeris: loaded {} epoch(s) from '{}'", eph.m_table.size(), source);
    return eph;
}

std::optional<JsonEphemeris> JsonEphemeris::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("JsonEphemeris: cannot open '{}'", path);
        return std::nullopt;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("JsonEphemeris: failed to parse '{}': {}", path, e.what());
        return std::nullopt;
    }
    return fromJson(json, path);
}

std::optional<Body> JsonEphemeris::lookup(const std::string& name,
                                          const std::string& epoch) const {
    auto epochIt = m_table.find(epoch);
    if (epochIt == m_table.end()) {
        return std::nullopt;
    }
    auto bodyIt = epochIt->second.find(name);
    if (bodyIt == epochIt->second.end()) {
        return std::nullopt;
    }
    return bodyIt->second;
}

std::vector<std::string> JsonEphemeris::epochs() const {
    std::vector<std::string> out;
    out.reserve(m_table.size());
    for (const auto& [epoch, bodies] : m_table) {
        out.push_back(epoch);
    }
    return out;
}

} // namespace orrery
