#include "engine/Ticker.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <exception>

namespace tickwell {

Ticker::Ticker(double tickPeriod)
    : m_tickPeriod(tickPeriod > 0.0 ? tickPeriod : DefaultTickPeriod) {
    if (tickPeriod <= 0.0) {
        LOG_WARN("Ticker: tick period must be > 0 (got {}), using {}", tickPeriod, DefaultTickPeriod);
    }
}

void Ticker::update(double dt) {
    if (m_paused || dt <= 0.0) return;

    m_accumulator += dt;

    int fired = 0;
    while (m_accumulator >= m_tickPeriod) {
        if (fired >= MAX_CATCHUP_TICKS) {
            LOG_WARN("Ticker: dropping {:.2f}s of tick backlog", m_accumulator);
            m_accumulator = 0.0;
            break;
        }
        m_accumulator -= m_tickPeriod;
        dispatch();
        ++fired;
    }
}

void Ticker::tick() {
    dispatch();
}

bool Ticker::subscribe(ITickable* tickable) {
    if (!tickable || isSubscribed(tickable)) return false;
    m_subscribers.push_back(tickable);
    return true;
}

bool Ticker::unsubscribe(ITickable* tickable) {
    auto it = std::find(m_subscribers.begin(), m_subscribers.end(), tickable);
    if (it == m_subscribers.end()) return false;
    m_subscribers.erase(it);
    return true;
}

bool Ticker::isSubscribed(const ITickable* tickable) const {
    return std::find(m_subscribers.begin(), m_subscribers.end(), tickable) != m_subscribers.end();
}

double Ticker::timeUntilNextTick() const {
    return std::max(0.0, m_tickPeriod - m_accumulator);
}

void Ticker::dispatch() {
    ++m_tickCount;

    auto snapshot = m_subscribers;
    for (ITickable* tickable : snapshot) {
        if (!isSubscribed(tickable)) continue;
        try {
            tickable->onTick();
        } catch (const std::exception& ex) {
            LOG_ERROR("Ticker: subscriber error on tick {}: {}", m_tickCount, ex.what());
        }
    }
}

} // namespace tickwell
