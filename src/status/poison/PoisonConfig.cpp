#include "status/poison/PoisonConfig.hpp"

#include <algorithm>
#include <cmath>

namespace tickwell {

int PoisonConfig::totalDecaySteps() const {
    int decay = std::max(1, decayAmountPerStep);
    double span = static_cast<double>(startDamagePerTick - minDamagePerTick);
    return std::max(1, static_cast<int>(std::ceil(span / decay)));
}

double PoisonConfig::lifetimeSeconds() const {
    if (decayAmountPerStep <= 0 || hitsPerDecayStep <= 0) return 0.0;
    double totalHits = static_cast<double>(totalDecaySteps()) * hitsPerDecayStep;
    return std::max(0.0, totalHits * effectiveInterval());
}

void from_json(const nlohmann::json& j, PoisonConfig& cfg) {
    cfg.id = j.value("id", "");
    cfg.startDamagePerTick = j.value("start_damage_per_tick", 0);
    cfg.tickIntervalSeconds = j.value("tick_interval_seconds", DefaultPoisonInterval);
    cfg.hitsPerDecayStep = j.value("hits_per_decay_step", 4);
    cfg.decayAmountPerStep = j.value("decay_amount_per_step", 1);
    cfg.minDamagePerTick = j.value("min_damage_per_tick", 0);
}

void to_json(nlohmann::json& j, const PoisonConfig& cfg) {
    j = nlohmann::json{
        {"id", cfg.id},
        {"start_damage_per_tick", cfg.startDamagePerTick},
        {"tick_interval_seconds", cfg.tickIntervalSeconds},
        {"hits_per_decay_step", cfg.hitsPerDecayStep},
        {"decay_amount_per_step", cfg.decayAmountPerStep},
        {"min_damage_per_tick", cfg.minDamagePerTick},
    };
}

} // namespace tickwell
