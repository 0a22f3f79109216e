#pragma once

#include "status/poison/PoisonConfig.hpp"

#include <functional>

namespace tickwell {

/// Runtime poison state machine.
///
/// Damage is dealt once per config interval. The per-hit damage is flat for
/// hitsPerDecayStep consecutive hits, then steps down by decayAmountPerStep
/// (never below minDamagePerTick). The effect ends once the damage reaches
/// the floor.
class PoisonEffect {
public:
    /// Receives the damage of each hit
    using DamageSink = std::function<void(int)>;

    explicit PoisonEffect(PoisonConfig config);

    /// Start or restart the poison. There is no partial refresh.
    void apply();

    /// Accumulate time and deal every hit that falls due. Handles several
    /// interval rollovers in one call and stops early if the effect ends.
    /// @return number of hits dealt
    int advance(double deltaSeconds, const DamageSink& dealDamage = {});

    /// Trusted transplant of saved state; never deals damage.
    void restoreState(int currentDamage, int ticksSinceDecay, double tickTimer);

    /// End immediately
    void forceEnd() { m_active = false; }

    bool isActive() const { return m_active; }
    int currentDamage() const { return m_currentDamage; }
    int ticksSinceDecay() const { return m_ticksSinceDecay; }
    double tickTimer() const { return m_tickTimer; }
    const PoisonConfig& config() const { return m_config; }

    /// Seconds until the next hit, clamped to [0, interval]
    double timeToNextTick() const;

    /// Inverse of timeToNextTick(): the elapsed timer that leaves
    /// remainingSeconds until the next hit, clamped to [0, interval].
    static double tickTimerFromRemaining(double intervalSeconds, double remainingSeconds);

private:
    PoisonConfig m_config;
    int m_currentDamage = 0;
    int m_ticksSinceDecay = 0;
    double m_tickTimer = 0.0;
    bool m_active = false;
};

} // namespace tickwell
