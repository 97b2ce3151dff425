#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

namespace orrery {

namespace {

using json = nlohmann::json;

/// Parse a whole file, or a discarded value if it cannot be read or parsed.
json parseFile(const std::string& path, bool& opened) {
    std::ifstream file(path);
    opened = file.is_open();
    if (!opened) {
        return json(json::value_t::discarded);
    }
    return json::parse(file, nullptr, false);
}

template <typename T>
T valueOr(const json* value, bool (json::*isType)() const noexcept, const T& fallback) {
    if (value && (value->*isType)()) {
        return value->get<T>();
    }
    return fallback;
}

} // namespace

bool Config::loadFromFile(const std::string& path) {
    bool opened = false;
    json parsed = parseFile(path, opened);
    if (!opened) {
        return false;
    }
    if (parsed.is_discarded()) {
        LOG_ERROR("Config: '{}' is not valid JSON", path);
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    json parsed = json::parse(jsonStr, nullptr, false);
    if (parsed.is_discarded()) {
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    bool opened = false;
    json overlay = parseFile(path, opened);
    if (!opened) {
        return false;
    }
    if (overlay.is_discarded()) {
        LOG_WARN("Config: ignoring overlay '{}', not valid JSON", path);
        return false;
    }
    m_data.merge_patch(overlay);
    return true;
}

bool Config::applyOverride(const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }

    std::string text = assignment.substr(eq + 1);
    json value = json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        value = text;
    }
    assign(assignment.substr(0, eq), std::move(value));
    return true;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    return valueOr(find(key), &json::is_string, defaultVal);
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const json* value = find(key);
    if (!value || !value->is_number_integer()) {
        return defaultVal;
    }

    constexpr auto lo = std::numeric_limits<int>::min();
    constexpr auto hi = std::numeric_limits<int>::max();
    bool inRange = value->is_number_unsigned()
        ? value->get<std::uint64_t>() <= static_cast<std::uint64_t>(hi)
        : value->get<std::int64_t>() >= lo && value->get<std::int64_t>() <= hi;
    if (!inRange) {
        LOG_WARN("Config: '{}' = {} does not fit in an int, using {}", key, value->dump(), defaultVal);
        return defaultVal;
    }
    return value->get<int>();
}

double Config::getDouble(const std::string& key, double defaultVal) const {
    return valueOr(find(key), &json::is_number, defaultVal);
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    return valueOr(find(key), &json::is_boolean, defaultVal);
}

std::vector<std::string> Config::getStringList(const std::string& key,
                                               const std::vector<std::string>& defaultVal) const {
    const json* list = find(key);
    if (!list || !list->is_array()) {
        return defaultVal;
    }

    std::vector<std::string> out;
    for (const auto& item : *list) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::vector<std::string> Config::splitKey(const std::string& key) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        std::size_t dot = key.find('.', start);
        segments.push_back(key.substr(start, dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments;
}

const json* Config::find(const std::string& key) const {
    const json* node = &m_data;
    for (const auto& segment : splitKey(key)) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(segment);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

void Config::assign(const std::string& key, json value) {
    json* node = &m_data;
    for (const auto& segment : splitKey(key)) {
        if (!node->is_object()) {
            if (!node->is_null()) {
                LOG_WARN("Config: replacing non-object value on the way to '{}'", key);
            }
            *node = json::object();
        }
        node = &(*node)[segment];
    }
    *node = std::move(value);
}

} // namespace orrery
