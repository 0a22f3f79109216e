#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tickwell {

class Config {
public:
    /// Load configuration from a JSON file. Returns false if the file
    /// cannot be read or parsed; missing keys are handled via default values.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    // --- Getters (read with dot-notation key paths) ---

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    double      getDouble(const std::string& key, double defaultVal = 0.0) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// Read an array of strings. Non-string elements are skipped.
    std::vector<std::string> getStringList(const std::string& key) const;

    /// Check if a key exists (supports dot-notation, e.g. "clock.tick_period").
    bool hasKey(const std::string& key) const;

    const nlohmann::json& raw() const { return m_data; }

private:
    /// Resolve a dot-separated key path into the nested JSON value.
    const nlohmann::json* resolve(const std::string& key) const;

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace tickwell
