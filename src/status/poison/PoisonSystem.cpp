#include "status/poison/PoisonSystem.hpp"
#include "status/BuffTimerService.hpp"
#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace tickwell {

PoisonSystem::PoisonSystem(Registry& registry, BuffTimerService* service, double tickPeriod)
    : m_registry(registry)
    , m_service(service)
    , m_tickPeriod(tickPeriod > 0.0 ? tickPeriod : DefaultTickPeriod) {
}

bool PoisonSystem::applyPoison(Entity entity, const PoisonConfig& config) {
    auto* status = m_registry.tryGet<PoisonStatus>(entity);
    if (!status) {
        LOG_WARN("PoisonSystem::applyPoison: entity {} has no PoisonStatus", entityId(entity));
        return false;
    }
    if (!status->enabled || status->isImmune() || !hasLiveTarget(entity)) {
        return false;
    }

    status->effect.emplace(config);
    status->effect->apply();
    if (!status->effect->isActive()) {
        // Start damage already at the floor: nothing to do
        status->effect.reset();
        return false;
    }

    configureTickCadence(*status);
    reportBuffTimer(entity, config, config.lifetimeSeconds(), false);
    LOG_DEBUG("Poisoned entity {} with '{}' ({} per hit)", entityId(entity), config.id, config.startDamagePerTick);
    return true;
}

void PoisonSystem::curePoison(Entity entity, double immunitySeconds) {
    auto* status = m_registry.tryGet<PoisonStatus>(entity);
    if (!status) return;

    if (status->effect) {
        endPoison(entity, *status);
        // Handlers of the end notification may have destroyed the entity
        status = m_registry.tryGet<PoisonStatus>(entity);
        if (!status) return;
    }
    status->immunityTimer = std::max(status->immunityTimer, immunitySeconds);
}

bool PoisonSystem::restorePoison(Entity entity, const PoisonConfig& config, int currentDamage,
                                 int ticksSinceDecay, double timeToNextTick) {
    if (!isReady(entity)) return false;

    auto& status = m_registry.get<PoisonStatus>(entity);
    status.effect.emplace(config);
    double tickTimer = PoisonEffect::tickTimerFromRemaining(config.effectiveInterval(), timeToNextTick);
    status.effect->restoreState(currentDamage, ticksSinceDecay, tickTimer);

    if (!status.effect->isActive()) {
        status.effect.reset();
    }
    configureTickCadence(status);
    return true;
}

bool PoisonSystem::setImmunity(Entity entity, double seconds) {
    auto* status = m_registry.tryGet<PoisonStatus>(entity);
    if (!status) return false;
    status->immunityTimer = std::max(0.0, seconds);
    return true;
}

double PoisonSystem::immunity(Entity entity) const {
    const auto* status = m_registry.tryGet<PoisonStatus>(entity);
    return status ? status->immunityTimer : 0.0;
}

void PoisonSystem::refreshTickCountdown(Entity entity) {
    auto* status = m_registry.tryGet<PoisonStatus>(entity);
    if (status) {
        configureTickCadence(*status);
    }
}

void PoisonSystem::resyncBuffTimer(Entity entity) {
    auto* status = m_registry.tryGet<PoisonStatus>(entity);
    if (!status || !status->isPoisoned()) return;

    const PoisonEffect& effect = *status->effect;
    reportBuffTimer(entity, effect.config(), remainingLifetimeSeconds(effect), true);
}

bool PoisonSystem::isEnabled(Entity entity) const {
    const auto* status = m_registry.tryGet<PoisonStatus>(entity);
    return status && status->enabled;
}

bool PoisonSystem::hasLiveTarget(Entity entity) const {
    const auto* health = m_registry.tryGet<Health>(entity);
    return health && health->isAlive();
}

void PoisonSystem::update(double dt) {
    if (dt <= 0.0) return;
    for (auto entity : m_registry.view<PoisonStatus>()) {
        auto& status = m_registry.get<PoisonStatus>(entity);
        if (status.immunityTimer > 0.0) {
            status.immunityTimer = std::max(0.0, status.immunityTimer - dt);
        }
    }
}

void PoisonSystem::onTick() {
    // Collect first: handlers may add or remove components while we iterate
    std::vector<Entity> poisoned;
    for (auto entity : m_registry.view<PoisonStatus>()) {
        const auto& status = m_registry.get<PoisonStatus>(entity);
        if (status.enabled && status.effect) {
            poisoned.push_back(entity);
        }
    }

    for (Entity entity : poisoned) {
        auto* status = m_registry.tryGet<PoisonStatus>(entity);
        if (!status || !status->effect) continue;

        if (!hasLiveTarget(entity)) {
            endPoison(entity, *status);
            continue;
        }

        if (status->ticksUntilNextDamage > 0) {
            --status->ticksUntilNextDamage;
        }

        std::vector<int> hits;
        auto* health = m_registry.tryGet<Health>(entity);
        status->effect->advance(m_tickPeriod, [&](int damage) {
            health->applyDamage(damage);
            hits.push_back(damage);
        });

        if (!hits.empty()) {
            status->ticksUntilNextDamage = status->intervalTicks;
        }
        const bool ended = !status->effect->isActive();

        for (int damage : hits) {
            m_poisonTick.emit(entity, damage);
        }

        status = m_registry.tryGet<PoisonStatus>(entity);
        if (ended && status && status->effect) {
            endPoison(entity, *status);
        }
    }
}

BuffDefinition PoisonSystem::makeBuffDefinition(const PoisonConfig& config, double durationSeconds) {
    BuffDefinition def;
    def.kind = BuffKind::Poison;
    def.displayName = "Poison";
    def.iconId = config.id.empty() ? "poison" : config.id;
    std::transform(def.iconId.begin(), def.iconId.end(), def.iconId.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    def.durationSeconds = std::max(0.0, durationSeconds);
    def.isRecurring = false;
    return def;
}

double PoisonSystem::remainingLifetimeSeconds(const PoisonEffect& effect) {
    const PoisonConfig& cfg = effect.config();
    const double lifetime = cfg.lifetimeSeconds();
    if (lifetime <= 0.0) return 0.0;

    const double interval = cfg.effectiveInterval();
    const int decayAmount = std::max(1, cfg.decayAmountPerStep);
    const int hitsPerStep = std::max(1, cfg.hitsPerDecayStep);

    // Completed decay steps plus hits into the current step
    int damageDelta = std::max(0, cfg.startDamagePerTick - effect.currentDamage());
    int completedSteps = std::clamp(damageDelta / decayAmount, 0, cfg.totalDecaySteps());
    int ticksIntoStep = std::clamp(effect.ticksSinceDecay(), 0, hitsPerStep - 1);
    double hitsConsumed = static_cast<double>(completedSteps) * hitsPerStep + ticksIntoStep;
    double elapsed = hitsConsumed * interval + std::clamp(effect.tickTimer(), 0.0, interval);

    return std::max(0.0, lifetime - elapsed);
}

void PoisonSystem::endPoison(Entity entity, PoisonStatus& status) {
    status.effect.reset();
    status.ticksUntilNextDamage = 0;
    status.intervalTicks = 0;

    if (m_service) {
        m_service->remove(entity, BuffKind::Poison);
    }
    LOG_DEBUG("Poison ended on entity {}", entityId(entity));
    m_poisonEnd.emit(entity);
}

void PoisonSystem::configureTickCadence(PoisonStatus& status) const {
    if (!status.effect) {
        status.ticksUntilNextDamage = 0;
        status.intervalTicks = 0;
        return;
    }

    const double interval = status.effect->config().effectiveInterval();
    status.intervalTicks = std::max<int64_t>(1, static_cast<int64_t>(std::ceil(interval / m_tickPeriod)));
    double remaining = status.effect->timeToNextTick();
    auto remainingTicks = static_cast<int64_t>(std::ceil(remaining / m_tickPeriod));
    status.ticksUntilNextDamage = std::clamp<int64_t>(remainingTicks, 0, status.intervalTicks);
}

void PoisonSystem::reportBuffTimer(Entity entity, const PoisonConfig& config, double durationSeconds,
                                   bool restoreExact) {
    if (!m_service) return;

    BuffEventContext ctx;
    ctx.entity = entity;
    ctx.sourceType = BuffSourceType::Combat;
    ctx.sourceId = config.id;

    if (!restoreExact) {
        ctx.definition = makeBuffDefinition(config, durationSeconds);
        ctx.resetTimer = true;
        m_service->apply(ctx);
        return;
    }

    if (durationSeconds <= 0.0) return;
    ctx.definition = makeBuffDefinition(config, config.lifetimeSeconds());
    ctx.resetTimer = false;
    auto remainingTicks = static_cast<int64_t>(std::ceil(durationSeconds / m_tickPeriod));
    m_service->restore(ctx, remainingTicks);
}

} // namespace tickwell
