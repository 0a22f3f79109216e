#pragma once

#include "status/poison/PoisonEffect.hpp"
#include "status/BuffTypes.hpp"
#include "engine/Signal.hpp"
#include "engine/Ticker.hpp"
#include "ecs/Entity.hpp"

#include <cstdint>
#include <optional>

namespace tickwell {

class Registry;
class BuffTimerService;

/// Per-entity poison controller state. Attach to any entity that can be
/// poisoned; the entity also needs a Health component to take damage.
struct PoisonStatus {
    bool enabled = true;
    std::optional<PoisonEffect> effect;
    double immunityTimer = 0.0;         // Seconds during which poison is refused
    int64_t ticksUntilNextDamage = 0;   // Clock ticks until the next hit (display cadence)
    int64_t intervalTicks = 0;          // Clock ticks per poison interval

    bool isPoisoned() const { return effect && effect->isActive(); }
    bool isImmune() const { return immunityTimer > 0.0; }
};

/// Drives PoisonStatus components: applies and cures poison, deals damage to
/// Health on clock ticks, counts down immunity on frame time, and mirrors
/// the poison lifetime into the BuffTimerService as a BuffKind::Poison timer.
class PoisonSystem : public ITickable {
public:
    /// @param service Buff registry to report the poison timer to (may be null)
    PoisonSystem(Registry& registry, BuffTimerService* service, double tickPeriod = DefaultTickPeriod);

    void setService(BuffTimerService* service) { m_service = service; }

    /// Poison an entity, restarting any current poison.
    /// Refused while immune, disabled, dead, or without a PoisonStatus.
    /// @return true if the poison was applied
    bool applyPoison(Entity entity, const PoisonConfig& config);

    /// End poison and grant at least `immunitySeconds` of immunity
    void curePoison(Entity entity, double immunitySeconds = 0.0);

    /// Trusted load path: install `config` and transplant the saved state
    /// without dealing damage or notifying the buff service.
    /// @return false if the entity is not ready (see isReady)
    bool restorePoison(Entity entity, const PoisonConfig& config, int currentDamage,
                       int ticksSinceDecay, double timeToNextTick);

    /// Set the immunity timer directly (load path). Negative values clamp to 0.
    bool setImmunity(Entity entity, double seconds);
    double immunity(Entity entity) const;

    /// Recompute the display cadence (ticks until next hit) from the effect
    void refreshTickCountdown(Entity entity);

    /// Re-derive the remaining poison lifetime from the effect's decay state
    /// and restore the matching BuffKind::Poison timer in the service.
    void resyncBuffTimer(Entity entity);

    /// PoisonStatus present and enabled
    bool isEnabled(Entity entity) const;

    /// Entity exists with a Health component that is still alive
    bool hasLiveTarget(Entity entity) const;

    /// Ready to accept restored poison state
    bool isReady(Entity entity) const { return isEnabled(entity) && hasLiveTarget(entity); }

    /// Count down immunity windows. Call once per frame.
    void update(double dt);

    /// Advance every active poison by one clock tick
    void onTick() override;

    /// Buff timer definition reported for a poison with `durationSeconds` left
    static BuffDefinition makeBuffDefinition(const PoisonConfig& config, double durationSeconds);

    /// Seconds of poison left given the effect's current decay progress
    static double remainingLifetimeSeconds(const PoisonEffect& effect);

    Signal<Entity, int>& onPoisonTick() { return m_poisonTick; }
    Signal<Entity>& onPoisonEnd() { return m_poisonEnd; }

    double tickPeriod() const { return m_tickPeriod; }

private:
    /// Clear the effect, drop the buff timer, and notify
    void endPoison(Entity entity, PoisonStatus& status);

    void configureTickCadence(PoisonStatus& status) const;

    void reportBuffTimer(Entity entity, const PoisonConfig& config, double durationSeconds, bool restoreExact);

    Registry& m_registry;
    BuffTimerService* m_service;
    double m_tickPeriod;

    Signal<Entity, int> m_poisonTick;
    Signal<Entity> m_poisonEnd;
};

} // namespace tickwell
