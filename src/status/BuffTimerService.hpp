#pragma once

#include "status/BuffTimerInstance.hpp"
#include "engine/Signal.hpp"
#include "engine/Ticker.hpp"

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace tickwell {

/// Default hard limit on tracked buffs, to contain runaway buff spawning
constexpr size_t DefaultMaxTrackedBuffs = 64;

/// Registry of active buff timers.
///
/// Tracks at most one BuffTimerInstance per (entity, kind), advances all of
/// them once per clock tick and publishes lifecycle notifications:
///   started  : a new instance was created by apply()
///   updated  : an existing instance changed (refresh, or a tick passed)
///   looped   : a recurring instance wrapped back to its full interval
///   warning  : a finite instance reached its expiry warning threshold
///   restored : restore() transplanted saved state (never "started")
///   ended    : an instance was removed (Manual) or ran out (Expired)
///
/// Within a tick, instances are processed and notified in ascending
/// sequenceId order.
///
/// Notifications are synchronous and handlers may call back into the
/// service, including for the same key: a started handler that calls
/// remove() on that key receives ended before apply() returns. Instances
/// are shared_ptr owned, so a reference handed to a handler stays valid
/// for the duration of the call even if the handler removes it.
class BuffTimerService : public ITickable {
public:
    using InstancePtr = std::shared_ptr<const BuffTimerInstance>;
    using InstanceSignal = Signal<const BuffTimerInstance&>;
    using EndedSignal = Signal<const BuffTimerInstance&, BuffEndReason>;

    explicit BuffTimerService(double tickPeriod = DefaultTickPeriod,
                              size_t maxTrackedBuffs = DefaultMaxTrackedBuffs);

    // Handlers hold `this` indirectly through subscribers; keep the address stable
    BuffTimerService(const BuffTimerService&) = delete;
    BuffTimerService& operator=(const BuffTimerService&) = delete;

    /// Start tracking a buff, or update the existing one for the same key.
    /// ctx.resetTimer decides whether an existing countdown restarts.
    /// @return The live instance, or nullptr if the entity is null or the
    ///         registry is full
    InstancePtr apply(const BuffEventContext& ctx);

    /// apply() with resetTimer forced off
    InstancePtr refresh(BuffEventContext ctx);

    /// Stop tracking a buff. No-op if absent.
    /// @return true if an instance was removed
    bool remove(Entity entity, BuffKind kind);

    /// Remove every buff on an entity (e.g. when it is destroyed)
    /// @return number of instances removed
    size_t removeAllFor(Entity entity);

    /// Trusted state transplant used by the load path. Creates or updates the
    /// instance like apply(), then sets the countdown to remainingTicks
    /// (clamped into range). Emits restored, never started.
    InstancePtr restore(const BuffEventContext& ctx, int64_t remainingTicks);

    /// Snapshot of an entity's active buffs in ascending sequenceId order
    std::vector<InstancePtr> getBuffsFor(Entity entity) const;

    /// Look up a single buff (nullptr if absent)
    InstancePtr tryGetBuff(Entity entity, BuffKind kind) const;

    /// Remove all buffs, emitting ended(Manual) for each
    void clear();

    /// Advance every active buff by one tick
    void onTick() override;

    size_t activeCount() const { return m_active.size(); }
    double tickPeriod() const { return m_tickPeriod; }
    size_t maxTrackedBuffs() const { return m_maxTrackedBuffs; }

    InstanceSignal& onStarted() { return m_started; }
    InstanceSignal& onUpdated() { return m_updated; }
    InstanceSignal& onLooped() { return m_looped; }
    InstanceSignal& onWarning() { return m_warning; }
    InstanceSignal& onRestored() { return m_restored; }
    EndedSignal& onEnded() { return m_ended; }

private:
    using InstanceMap = std::unordered_map<BuffKey, std::shared_ptr<BuffTimerInstance>, BuffKeyHash>;

    /// Create and register a new instance; nullptr when at capacity
    std::shared_ptr<BuffTimerInstance> create(const BuffEventContext& ctx);

    /// Detach an instance from the registry and notify ended
    void end(InstanceMap::iterator it, BuffEndReason reason);

    /// All instances sorted by sequenceId
    std::vector<std::shared_ptr<BuffTimerInstance>> orderedSnapshot() const;

    InstanceMap m_active;
    uint64_t m_sequenceCounter = 0;
    double m_tickPeriod;
    size_t m_maxTrackedBuffs;

    InstanceSignal m_started;
    InstanceSignal m_updated;
    InstanceSignal m_looped;
    InstanceSignal m_warning;
    InstanceSignal m_restored;
    EndedSignal m_ended;
};

} // namespace tickwell
