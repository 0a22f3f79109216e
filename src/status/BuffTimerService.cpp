#include "status/BuffTimerService.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace tickwell {

BuffTimerService::BuffTimerService(double tickPeriod, size_t maxTrackedBuffs)
    : m_tickPeriod(tickPeriod > 0.0 ? tickPeriod : DefaultTickPeriod)
    , m_maxTrackedBuffs(maxTrackedBuffs > 0 ? maxTrackedBuffs : DefaultMaxTrackedBuffs) {
}

BuffTimerService::InstancePtr BuffTimerService::apply(const BuffEventContext& ctx) {
    if (ctx.entity == NullEntity) {
        LOG_WARN("BuffTimerService::apply: ignoring {} for null entity",
                 buffKindToString(ctx.definition.kind));
        return nullptr;
    }

    BuffKey key(ctx.entity, ctx.definition.kind);
    auto it = m_active.find(key);
    if (it == m_active.end()) {
        auto instance = create(ctx);
        if (!instance) return nullptr;

        LOG_DEBUG("Started buff {} on entity {} (ticks: {})",
                  instance->displayName(), entityId(ctx.entity), instance->remainingTicks());
        m_started.emit(*instance);
        return instance;
    }

    // Hold a reference so handlers removing the key can't free it under us
    std::shared_ptr<BuffTimerInstance> instance = it->second;
    instance->applyContext(ctx, false);
    LOG_DEBUG("Refreshed buff {} on entity {} (ticks: {}, reset: {})",
              instance->displayName(), entityId(ctx.entity), instance->remainingTicks(), ctx.resetTimer);
    m_updated.emit(*instance);
    return instance;
}

BuffTimerService::InstancePtr BuffTimerService::refresh(BuffEventContext ctx) {
    ctx.resetTimer = false;
    return apply(ctx);
}

bool BuffTimerService::remove(Entity entity, BuffKind kind) {
    auto it = m_active.find(BuffKey(entity, kind));
    if (it == m_active.end()) return false;

    end(it, BuffEndReason::Manual);
    return true;
}

size_t BuffTimerService::removeAllFor(Entity entity) {
    size_t removed = 0;
    for (const auto& instance : getBuffsFor(entity)) {
        if (remove(instance->entity(), instance->kind())) {
            ++removed;
        }
    }
    return removed;
}

BuffTimerService::InstancePtr BuffTimerService::restore(const BuffEventContext& ctx, int64_t remainingTicks) {
    if (ctx.entity == NullEntity) {
        LOG_WARN("BuffTimerService::restore: ignoring {} for null entity",
                 buffKindToString(ctx.definition.kind));
        return nullptr;
    }

    BuffKey key(ctx.entity, ctx.definition.kind);
    std::shared_ptr<BuffTimerInstance> instance;
    auto it = m_active.find(key);
    if (it == m_active.end()) {
        instance = create(ctx);
        if (!instance) return nullptr;
    } else {
        instance = it->second;
        BuffEventContext keep = ctx;
        keep.resetTimer = false;
        instance->applyContext(keep, false);
    }

    instance->restoreRemaining(remainingTicks);
    LOG_DEBUG("Restored buff {} on entity {} (ticks: {}, saved: {})",
              instance->displayName(), entityId(ctx.entity), instance->remainingTicks(), remainingTicks);
    m_restored.emit(*instance);
    return instance;
}

std::vector<BuffTimerService::InstancePtr> BuffTimerService::getBuffsFor(Entity entity) const {
    std::vector<InstancePtr> result;
    for (const auto& [key, instance] : m_active) {
        if (key.entity == entity) {
            result.push_back(instance);
        }
    }
    std::sort(result.begin(), result.end(),
        [](const InstancePtr& a, const InstancePtr& b) { return a->sequenceId() < b->sequenceId(); });
    return result;
}

BuffTimerService::InstancePtr BuffTimerService::tryGetBuff(Entity entity, BuffKind kind) const {
    auto it = m_active.find(BuffKey(entity, kind));
    return it != m_active.end() ? it->second : nullptr;
}

void BuffTimerService::clear() {
    for (const auto& instance : orderedSnapshot()) {
        auto it = m_active.find(instance->key());
        if (it != m_active.end() && it->second == instance) {
            end(it, BuffEndReason::Manual);
        }
    }
}

void BuffTimerService::onTick() {
    if (m_active.empty()) return;

    for (const auto& instance : orderedSnapshot()) {
        // A handler earlier in this tick may have removed or replaced it
        auto it = m_active.find(instance->key());
        if (it == m_active.end() || it->second != instance) continue;

        if (instance->isIndefinite()) continue;

        if (instance->isRecurring()) {
            if (instance->step()) {
                m_looped.emit(*instance);
            }
            m_updated.emit(*instance);
            continue;
        }

        if (!instance->hasDuration()) continue;

        bool expired = instance->step();

        if (instance->canWarn() && instance->remainingTicks() == instance->warningTicks()) {
            m_warning.emit(*instance);
        }

        if (expired) {
            // Warning handlers may have removed it already
            it = m_active.find(instance->key());
            if (it != m_active.end() && it->second == instance) {
                LOG_DEBUG("Buff {} on entity {} expired", instance->displayName(), entityId(instance->entity()));
                end(it, BuffEndReason::Expired);
            }
        } else {
            m_updated.emit(*instance);
        }
    }
}

std::shared_ptr<BuffTimerInstance> BuffTimerService::create(const BuffEventContext& ctx) {
    if (m_active.size() >= m_maxTrackedBuffs) {
        LOG_WARN("BuffTimerService reached the maximum capacity of {}. Ignoring new buff {}.",
                 m_maxTrackedBuffs, buffKindToString(ctx.definition.kind));
        return nullptr;
    }

    auto instance = std::make_shared<BuffTimerInstance>(ctx, ++m_sequenceCounter, m_tickPeriod);
    m_active[instance->key()] = instance;
    return instance;
}

void BuffTimerService::end(InstanceMap::iterator it, BuffEndReason reason) {
    std::shared_ptr<BuffTimerInstance> instance = std::move(it->second);
    m_active.erase(it);
    if (reason == BuffEndReason::Manual) {
        LOG_DEBUG("Removed buff {} from entity {}", instance->displayName(), entityId(instance->entity()));
    }
    m_ended.emit(*instance, reason);
}

std::vector<std::shared_ptr<BuffTimerInstance>> BuffTimerService::orderedSnapshot() const {
    std::vector<std::shared_ptr<BuffTimerInstance>> snapshot;
    snapshot.reserve(m_active.size());
    for (const auto& [key, instance] : m_active) {
        snapshot.push_back(instance);
    }
    std::sort(snapshot.begin(), snapshot.end(),
        [](const auto& a, const auto& b) { return a->sequenceId() < b->sequenceId(); });
    return snapshot;
}

} // namespace tickwell
