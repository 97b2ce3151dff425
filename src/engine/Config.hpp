#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace orrery {

/// JSON-backed settings addressed by dot-separated paths
/// ("simulation.time_step"). Reads never throw: a missing key or a value of
/// the wrong type yields the caller's default.
class Config {
public:
    /// Replace the document with the contents of `path`. Returns false, and
    /// keeps the current document, if the file is missing or malformed.
    bool loadFromFile(const std::string& path);

    bool loadFromString(const std::string& jsonStr);

    /// Apply `path` as a JSON merge patch (RFC 7396): objects merge
    /// recursively, anything else replaces, null deletes the key.
    bool mergeFromFile(const std::string& path);

    /// "key.path=value" from the command line. The value is read as JSON
    /// when it parses ("60", "true", "[\"sun\"]") and as a plain string
    /// otherwise. Returns false without '=' or with an empty key.
    bool applyOverride(const std::string& assignment);

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    double      getDouble(const std::string& key, double defaultVal = 0.0) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// String elements of the array at `key`, skipping anything else.
    std::vector<std::string> getStringList(const std::string& key,
                                           const std::vector<std::string>& defaultVal = {}) const;

    void setString(const std::string& key, const std::string& value) { assign(key, value); }
    void setInt(const std::string& key, int value) { assign(key, value); }
    void setDouble(const std::string& key, double value) { assign(key, value); }
    void setBool(const std::string& key, bool value) { assign(key, value); }

    bool hasKey(const std::string& key) const { return find(key) != nullptr; }

    const nlohmann::json& raw() const { return m_data; }

private:
    static std::vector<std::string> splitKey(const std::string& key);

    /// Value at `key`, or nullptr if any segment is missing.
    const nlohmann::json* find(const std::string& key) const;

    /// Store `value` at `key`, turning missing or scalar parents into objects.
    void assign(const std::string& key, nlohmann::json value);

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace orrery
