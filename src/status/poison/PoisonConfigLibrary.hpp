#pragma once

#include "status/poison/PoisonConfig.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace tickwell {

/// Read-only catalogue of poison configs, keyed case-insensitively by id.
///
/// JSON format:
///   { "poisons": [ { "id": "weak", "start_damage_per_tick": 2, ... } ] }
///
/// Lookups of unknown ids are logged at error level once and the miss is
/// cached, so repeated restores don't spam the log.
class PoisonConfigLibrary {
public:
    PoisonConfigLibrary() = default;

    /// Load every config in a JSON file. Returns false if the file cannot be
    /// read or has no "poisons" array.
    bool loadFromFile(const std::string& path);

    /// Load every config in a parsed JSON document
    bool loadFromJson(const nlohmann::json& json);

    /// Add or replace a config. Configs with an empty id are rejected.
    bool registerConfig(const PoisonConfig& config);

    /// Look up a config by id (case-insensitive). nullptr if unknown.
    const PoisonConfig* resolve(const std::string& id) const;

    /// Id of the config every persisted poison is normalised to
    void setCanonicalId(const std::string& id) { m_canonicalId = id; }
    const std::string& canonicalId() const { return m_canonicalId; }

    /// The canonical config, or nullptr if it cannot be resolved
    const PoisonConfig* canonical() const { return resolve(m_canonicalId); }

    /// True if `id` names the canonical config (case-insensitive)
    bool isCanonical(const std::string& id) const;

    size_t size() const { return m_configs.size(); }
    void clear();

private:
    static std::string normalizeId(const std::string& id);

    std::unordered_map<std::string, PoisonConfig> m_configs;
    std::string m_canonicalId = "default";
    mutable std::unordered_set<std::string> m_missing;
};

} // namespace tickwell
