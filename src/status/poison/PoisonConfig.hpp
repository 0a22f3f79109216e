#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace tickwell {

/// Fallback seconds between poison hits when a config leaves it unset
constexpr double DefaultPoisonInterval = 15.0;

/// Tuning for one poison variant
struct PoisonConfig {
    std::string id;                     // Unique identifier, persisted in saves
    int startDamagePerTick = 0;         // Damage per hit when first applied
    double tickIntervalSeconds = DefaultPoisonInterval;
    int hitsPerDecayStep = 4;           // Hits before severity steps down
    int decayAmountPerStep = 1;         // Damage removed per decay step
    int minDamagePerTick = 0;           // Floor; poison ends on reaching it

    /// Interval with the non-positive fallback applied
    double effectiveInterval() const {
        return tickIntervalSeconds > 0.0 ? tickIntervalSeconds : DefaultPoisonInterval;
    }

    /// Total seconds from a fresh application until the damage reaches the
    /// floor, or 0 when the config never decays.
    double lifetimeSeconds() const;

    /// Number of decay steps from start damage down to the floor (minimum 1)
    int totalDecaySteps() const;
};

void from_json(const nlohmann::json& j, PoisonConfig& cfg);
void to_json(nlohmann::json& j, const PoisonConfig& cfg);

} // namespace tickwell
