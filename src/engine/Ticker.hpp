#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tickwell {

/// Default tick period in seconds (one game tick)
constexpr double DefaultTickPeriod = 0.6;

/// Receiver of fixed-rate ticks
class ITickable {
public:
    virtual ~ITickable() = default;

    /// Called once per elapsed tick
    virtual void onTick() = 0;
};

/// Fixed-rate tick source.
///
/// Accumulates frame time and fires every subscriber once per elapsed
/// tick period. Subscribing or unsubscribing from inside onTick() is safe;
/// a subscriber removed mid-dispatch is not called for the rest of that
/// tick, and one added mid-dispatch first fires on the next tick.
class Ticker {
public:
    explicit Ticker(double tickPeriod = DefaultTickPeriod);

    /// Advance by frame time, firing as many ticks as have elapsed.
    /// @param dt Seconds since the last update
    void update(double dt);

    /// Fire a single tick immediately, independent of accumulated time.
    void tick();

    /// Register a tickable. Duplicate registrations are ignored.
    /// @return true if newly subscribed
    bool subscribe(ITickable* tickable);

    /// Remove a tickable. @return true if it was subscribed
    bool unsubscribe(ITickable* tickable);

    bool isSubscribed(const ITickable* tickable) const;
    size_t subscriberCount() const { return m_subscribers.size(); }

    /// Stop ticking until resume() is called
    void pause() { m_paused = true; }
    void resume() { m_paused = false; }
    bool isPaused() const { return m_paused; }

    double tickPeriod() const { return m_tickPeriod; }

    /// Seconds until the next tick fires (presentation interpolation only)
    double timeUntilNextTick() const;

    /// Total ticks fired since construction
    uint64_t tickCount() const { return m_tickCount; }

private:
    void dispatch();

    std::vector<ITickable*> m_subscribers;
    double m_tickPeriod;
    double m_accumulator = 0.0;
    uint64_t m_tickCount = 0;
    bool m_paused = false;

    static constexpr int MAX_CATCHUP_TICKS = 50; // Drop backlog beyond this (e.g. after suspend)
};

} // namespace tickwell
