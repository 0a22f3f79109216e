#include "status/poison/PoisonEffect.hpp"

#include <algorithm>
#include <utility>

namespace tickwell {

PoisonEffect::PoisonEffect(PoisonConfig config)
    : m_config(std::move(config)) {
}

void PoisonEffect::apply() {
    m_currentDamage = m_config.startDamagePerTick;
    m_ticksSinceDecay = 0;
    m_tickTimer = 0.0;
    m_active = m_currentDamage > m_config.minDamagePerTick;
}

int PoisonEffect::advance(double deltaSeconds, const DamageSink& dealDamage) {
    if (!m_active || deltaSeconds <= 0.0) return 0;

    const double interval = m_config.effectiveInterval();
    m_tickTimer += deltaSeconds;

    int hits = 0;
    while (m_active && m_tickTimer >= interval) {
        m_tickTimer -= interval;
        if (dealDamage) {
            dealDamage(m_currentDamage);
        }
        ++hits;

        ++m_ticksSinceDecay;
        if (m_ticksSinceDecay >= m_config.hitsPerDecayStep) {
            m_ticksSinceDecay = 0;
            m_currentDamage = std::max(m_config.minDamagePerTick,
                                       m_currentDamage - m_config.decayAmountPerStep);
        }
        if (m_currentDamage <= m_config.minDamagePerTick) {
            m_active = false;
        }
    }

    if (!m_active) {
        m_tickTimer = 0.0;
    }
    return hits;
}

void PoisonEffect::restoreState(int currentDamage, int ticksSinceDecay, double tickTimer) {
    const double interval = m_config.effectiveInterval();
    m_currentDamage = currentDamage;
    m_ticksSinceDecay = std::clamp(ticksSinceDecay, 0, std::max(0, m_config.hitsPerDecayStep - 1));
    m_tickTimer = std::clamp(tickTimer, 0.0, interval);
    m_active = currentDamage > m_config.minDamagePerTick;
}

double PoisonEffect::timeToNextTick() const {
    const double interval = m_config.effectiveInterval();
    return std::clamp(interval - m_tickTimer, 0.0, interval);
}

double PoisonEffect::tickTimerFromRemaining(double intervalSeconds, double remainingSeconds) {
    if (intervalSeconds <= 0.0) intervalSeconds = DefaultPoisonInterval;
    double remaining = std::clamp(remainingSeconds, 0.0, intervalSeconds);
    return intervalSeconds - remaining;
}

} // namespace tickwell
