#include "status/BuffStateSaveBridge.hpp"
#include "status/poison/PoisonSystem.hpp"
#include "status/poison/PoisonConfigLibrary.hpp"
#include "save/SaveStore.hpp"
#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>

namespace tickwell {

namespace {

auto findKind(std::vector<BuffSaveEntry>& entries, BuffKind kind) {
    return std::find_if(entries.begin(), entries.end(),
        [kind](const BuffSaveEntry& entry) { return entry.kind() == kind; });
}

} // anonymous namespace

BuffStateSaveBridge::BuffStateSaveBridge(Registry& registry, SaveStore& store, Ticker& ticker,
                                         ServiceProvider serviceProvider, std::string saveKey)
    : m_registry(registry)
    , m_store(store)
    , m_ticker(ticker)
    , m_serviceProvider(std::move(serviceProvider))
    , m_saveKey(std::move(saveKey)) {
}

BuffStateSaveBridge::~BuffStateSaveBridge() {
    stopRetryLoop();
    if (m_enabled) {
        m_store.unregisterSaveable(this);
    }
    unhookService();
}

void BuffStateSaveBridge::setTarget(Entity entity) {
    if (entity == m_target) return;
    m_target = entity;
    m_cache.clear();

    if (m_hookedService && m_registry.valid(m_target)) {
        for (const auto& instance : m_hookedService->getBuffsFor(m_target)) {
            cacheInstance(*instance);
        }
    }
}

void BuffStateSaveBridge::setIgnoredKinds(const std::vector<BuffKind>& kinds) {
    m_ignoredKinds.clear();
    for (BuffKind kind : kinds) {
        m_ignoredKinds.insert(static_cast<int>(kind));
    }
}

bool BuffStateSaveBridge::isIgnored(BuffKind kind) const {
    return m_ignoredKinds.count(static_cast<int>(kind)) > 0;
}

void BuffStateSaveBridge::setEnabled(bool enabled) {
    if (enabled == m_enabled) return;

    if (enabled) {
        m_enabled = true;
        resolveService();
        // Registration loads immediately
        m_store.registerSaveable(this);
        return;
    }

    stopRetryLoop();
    save();
    m_store.unregisterSaveable(this);
    if (!m_pending.empty()) {
        SAVE_LOG_DEBUG("Bridge '{}' disabled with {} record(s) still pending", m_saveKey, m_pending.size());
    }
    m_pending.clear();
    m_pendingImmunity.reset();
    unhookService();
    m_enabled = false;
}

// ============================================================================
// Save / Load
// ============================================================================

void BuffStateSaveBridge::save() {
    std::vector<BuffSaveEntry> entries;

    BuffTimerService* service = resolveService();
    if (service && m_registry.valid(m_target)) {
        for (const auto& instance : service->getBuffsFor(m_target)) {
            if (isIgnored(instance->kind())) continue;
            entries.push_back(captureEntry(*instance));
        }
    } else {
        // Service or entity momentarily gone: fall back to the last mirror
        entries = m_cache;
        for (auto& entry : entries) {
            fillPoisonFields(entry);
        }
    }

    // Not yet restored records are still part of the saved state, including
    // the ones a replay in progress has not reached
    for (const auto* staged : {&m_inFlight, &m_pending}) {
        for (const auto& record : *staged) {
            if (findKind(entries, record.kind()) == entries.end()) {
                entries.push_back(record);
            }
        }
    }

    const double immunity = immunityToSave();
    if (entries.empty() && immunity <= 0.0) {
        m_store.remove(m_saveKey);
        return;
    }

    if (!m_store.save(m_saveKey, makeBuffSaveRecord(entries, immunity))) {
        SAVE_LOG_ERROR("Failed to save {} buff(s) under '{}'", entries.size(), m_saveKey);
        return;
    }
    SAVE_LOG_DEBUG("Saved {} buff(s) under '{}'", entries.size(), m_saveKey);
}

void BuffStateSaveBridge::load() {
    auto record = m_store.load(m_saveKey);
    if (!record) return;

    size_t staged = 0;
    for (auto& entry : parseBuffSaveRecord(*record)) {
        if (isIgnored(entry.kind())) continue;

        // A repeated load replaces, never duplicates, a staged record
        auto it = findKind(m_pending, entry.kind());
        if (it != m_pending.end()) {
            *it = std::move(entry);
        } else {
            m_pending.push_back(std::move(entry));
        }
        ++staged;
    }
    if (auto immunity = parsePoisonImmunity(*record)) {
        m_pendingImmunity = *immunity;
    }
    SAVE_LOG_DEBUG("Loaded {} buff record(s) from '{}'", staged, m_saveKey);

    if (!tryRestorePending()) {
        ensureRetryLoop();
    }
}

// ============================================================================
// Restoration
// ============================================================================

bool BuffStateSaveBridge::tryRestorePending() {
    if (m_pending.empty() && !m_pendingImmunity) return true;
    // Handlers of a replay in progress must not start another one
    if (m_restoring) return false;

    if (!m_pending.empty()) {
        BuffTimerService* service = resolveService();
        if (!service || !m_registry.valid(m_target)) {
            return false;
        }

        // Restore all records together or none, so listeners never observe a
        // registry with only part of the saved state
        bool hasPoison = findKind(m_pending, BuffKind::Poison) != m_pending.end();
        if (hasPoison && !poisonReady()) {
            return false;
        }

        m_restoring = true;
        m_inFlight.swap(m_pending);

        size_t restored = 0;
        while (!m_inFlight.empty()) {
            const BuffSaveEntry record = m_inFlight.front();
            const bool poison = record.kind() == BuffKind::Poison;

            PoisonRestore result = poison ? restorePoisonRecord(record) : PoisonRestore::Restored;
            if (result == PoisonRestore::NotReady) {
                // Back to pending before it leaves the in-flight list
                if (findKind(m_pending, record.kind()) == m_pending.end()) {
                    m_pending.push_back(record);
                }
            } else if (result == PoisonRestore::Inactive) {
                SAVE_LOG_DEBUG("Saved poison for '{}' was already spent, dropping its timer", m_saveKey);
            } else {
                BuffEventContext ctx;
                ctx.entity = m_target;
                ctx.definition = record.definition;
                ctx.sourceType = record.sourceType;
                ctx.sourceId = record.sourceId;
                ctx.resetTimer = false;
                service->restore(ctx, record.remainingTicks);

                if (poison && m_poison) {
                    m_poison->refreshTickCountdown(m_target);
                }
                ++restored;
            }
            m_inFlight.erase(m_inFlight.begin());
        }
        m_restoring = false;

        if (restored > 0) {
            SAVE_LOG_INFO("Restored {} buff(s) for '{}' ({} deferred)", restored, m_saveKey, m_pending.size());
        }
    }

    restorePendingImmunity();
    return m_pending.empty() && !m_pendingImmunity;
}

BuffStateSaveBridge::PoisonRestore BuffStateSaveBridge::restorePoisonRecord(const BuffSaveEntry& record) {
    if (!poisonReady()) return PoisonRestore::NotReady;

    const PoisonConfig* config = m_library ? m_library->canonical() : nullptr;
    if (!config) {
        if (!m_missingConfigLogged) {
            SAVE_LOG_ERROR("Canonical poison config '{}' is unavailable; restoring poison timer and immunity only",
                           m_library ? m_library->canonicalId() : std::string("<no library>"));
            m_missingConfigLogged = true;
        }
        m_poison->setImmunity(m_target, record.poisonImmunityTimer);
        return PoisonRestore::Restored;
    }

    if (!record.poisonConfigId.empty() && !m_library->isCanonical(record.poisonConfigId)) {
        SAVE_LOG_WARN("Saved poison config '{}' does not match '{}', normalizing",
                      record.poisonConfigId, config->id);
    }

    if (!m_poison->restorePoison(m_target, *config, record.poisonCurrentDamage,
                                 record.poisonTicksSinceDecay, record.poisonTimeToNextTick)) {
        return PoisonRestore::NotReady;
    }
    m_poison->setImmunity(m_target, record.poisonImmunityTimer);

    const auto* status = m_registry.tryGet<PoisonStatus>(m_target);
    return status && status->isPoisoned() ? PoisonRestore::Restored : PoisonRestore::Inactive;
}

void BuffStateSaveBridge::restorePendingImmunity() {
    if (!m_pendingImmunity || !m_poison || !m_registry.valid(m_target)) return;
    // A waiting Poison record carries its own immunity; apply ours after it
    if (findKind(m_pending, BuffKind::Poison) != m_pending.end()) return;

    if (m_poison->setImmunity(m_target, *m_pendingImmunity)) {
        SAVE_LOG_DEBUG("Restored {:.2f}s of poison immunity for '{}'", *m_pendingImmunity, m_saveKey);
        m_pendingImmunity.reset();
    }
}

double BuffStateSaveBridge::immunityToSave() {
    if (m_pendingImmunity) {
        return *m_pendingImmunity;
    }
    if (const auto* status = m_registry.tryGet<PoisonStatus>(m_target)) {
        m_cachedImmunity = status->immunityTimer;
    }
    return m_cachedImmunity;
}

bool BuffStateSaveBridge::poisonReady() const {
    return m_poison && m_poison->isReady(m_target);
}

void BuffStateSaveBridge::onTick() {
    if (!m_enabled) {
        stopRetryLoop();
        return;
    }

    ++m_retryAttempts;
    if (tryRestorePending()) {
        stopRetryLoop();
    }
}

void BuffStateSaveBridge::ensureRetryLoop() {
    if (!m_enabled || m_retryLoopRunning) return;
    m_ticker.subscribe(this);
    m_retryLoopRunning = true;
    SAVE_LOG_DEBUG("Deferring {} buff record(s) for '{}'", m_pending.size(), m_saveKey);
}

void BuffStateSaveBridge::stopRetryLoop() {
    if (!m_retryLoopRunning) return;
    m_ticker.unsubscribe(this);
    m_retryLoopRunning = false;
}

BuffStateSaveBridge::State BuffStateSaveBridge::state() const {
    if (m_restoring) return State::Restoring;
    if (!m_pending.empty() || m_pendingImmunity) return State::Deferred;
    if (m_hookedService) return State::Capturing;
    return State::Idle;
}

std::string BuffStateSaveBridge::saveKeyFor(const Registry& registry, Entity entity) {
    const auto* name = registry.tryGet<Name>(entity);
    if (name && !name->value.empty()) {
        return "buffs_" + name->value;
    }
    return "buffs_" + std::to_string(entityId(entity));
}

// ============================================================================
// Capture cache
// ============================================================================

BuffTimerService* BuffStateSaveBridge::resolveService() {
    BuffTimerService* service = m_serviceProvider ? m_serviceProvider() : nullptr;
    if (!m_enabled || service == m_hookedService) {
        return service;
    }

    // The previous service was replaced or destroyed; its handlers went with it
    m_hookedService = nullptr;
    m_instanceHandlers.clear();
    m_endedHandler = InvalidSignalHandlerId;

    if (service) {
        hookService(service);
    }
    return service;
}

void BuffStateSaveBridge::hookService(BuffTimerService* service) {
    auto mirror = [this](const BuffTimerInstance& instance) {
        if (instance.entity() == m_target) {
            cacheInstance(instance);
        }
    };
    m_instanceHandlers.push_back(service->onStarted().connect(mirror));
    m_instanceHandlers.push_back(service->onUpdated().connect(mirror));
    m_instanceHandlers.push_back(service->onRestored().connect(mirror));
    m_endedHandler = service->onEnded().connect([this](const BuffTimerInstance& instance, BuffEndReason) {
        if (instance.entity() == m_target) {
            uncacheInstance(instance);
        }
    });
    m_hookedService = service;

    m_cache.clear();
    if (m_registry.valid(m_target)) {
        for (const auto& instance : service->getBuffsFor(m_target)) {
            cacheInstance(*instance);
        }
    }
}

void BuffStateSaveBridge::unhookService() {
    if (!m_hookedService) return;

    // Only disconnect from a service that is still the live one
    BuffTimerService* current = m_serviceProvider ? m_serviceProvider() : nullptr;
    if (current == m_hookedService) {
        m_hookedService->onStarted().disconnect(m_instanceHandlers[0]);
        m_hookedService->onUpdated().disconnect(m_instanceHandlers[1]);
        m_hookedService->onRestored().disconnect(m_instanceHandlers[2]);
        m_hookedService->onEnded().disconnect(m_endedHandler);
    }
    m_instanceHandlers.clear();
    m_endedHandler = InvalidSignalHandlerId;
    m_hookedService = nullptr;
}

BuffSaveEntry BuffStateSaveBridge::captureEntry(const BuffTimerInstance& instance) const {
    BuffSaveEntry entry;
    entry.definition = instance.definition();
    entry.sourceType = instance.sourceType();
    entry.sourceId = instance.sourceId();
    entry.remainingTicks = instance.remainingTicks();
    fillPoisonFields(entry);
    return entry;
}

void BuffStateSaveBridge::fillPoisonFields(BuffSaveEntry& entry) const {
    if (entry.kind() != BuffKind::Poison) return;

    const auto* status = m_registry.tryGet<PoisonStatus>(m_target);
    if (!status) return;

    entry.poisonImmunityTimer = status->immunityTimer;
    if (!status->effect) return;

    const PoisonEffect& effect = *status->effect;
    entry.poisonConfigId = effect.config().id;
    entry.poisonCurrentDamage = effect.currentDamage();
    entry.poisonTicksSinceDecay = effect.ticksSinceDecay();
    entry.poisonTimeToNextTick = effect.timeToNextTick();
}

void BuffStateSaveBridge::cacheInstance(const BuffTimerInstance& instance) {
    if (isIgnored(instance.kind())) return;

    if (const auto* status = m_registry.tryGet<PoisonStatus>(m_target)) {
        m_cachedImmunity = status->immunityTimer;
    }

    BuffSaveEntry entry = captureEntry(instance);
    auto it = findKind(m_cache, instance.kind());
    if (it != m_cache.end()) {
        *it = std::move(entry);
    } else {
        m_cache.push_back(std::move(entry));
    }
}

void BuffStateSaveBridge::uncacheInstance(const BuffTimerInstance& instance) {
    auto it = findKind(m_cache, instance.kind());
    if (it != m_cache.end()) {
        m_cache.erase(it);
    }
}

} // namespace tickwell
