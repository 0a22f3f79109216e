#pragma once

#include "status/BuffSaveRecord.hpp"
#include "status/BuffTimerService.hpp"
#include "save/ISaveable.hpp"
#include "engine/Signal.hpp"
#include "engine/Ticker.hpp"
#include "ecs/Entity.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tickwell {

class Registry;
class SaveStore;
class PoisonSystem;
class PoisonConfigLibrary;

/// Persists the buff timers of one entity.
///
/// While enabled the bridge mirrors every started / updated / restored /
/// ended notification for its entity into a cache, so a snapshot exists
/// even if the service is gone at save time.
///
/// load() stages the saved records and replays them through
/// BuffTimerService::restore(). Replay waits until the service exists, the
/// entity is valid and, when a Poison record is pending, the entity's
/// PoisonStatus is enabled with a live target. Until then every record is
/// deferred together and retried once per clock tick (the bridge subscribes
/// itself to the Ticker at most once). Disabling the bridge stops the retry.
///
/// Poison immunity is saved at record level as well, so a cured entity keeps
/// its immunity window across a reload even though it has no Poison timer.
class BuffStateSaveBridge : public ISaveable, public ITickable {
public:
    /// Returns the buff service, or nullptr while it doesn't exist yet
    using ServiceProvider = std::function<BuffTimerService*()>;

    enum class State {
        Idle,       // Not attached to a service and nothing pending
        Capturing,  // Mirroring live service state, nothing pending
        Deferred,   // Records waiting for their dependencies
        Restoring   // Pending records are being replayed
    };

    BuffStateSaveBridge(Registry& registry, SaveStore& store, Ticker& ticker,
                        ServiceProvider serviceProvider, std::string saveKey);
    ~BuffStateSaveBridge() override;

    BuffStateSaveBridge(const BuffStateSaveBridge&) = delete;
    BuffStateSaveBridge& operator=(const BuffStateSaveBridge&) = delete;

    /// Entity whose buffs are persisted (may be NullEntity until it exists)
    void setTarget(Entity entity);
    Entity target() const { return m_target; }

    /// Collaborators for the nested poison state (either may be null)
    void setPoisonSystem(PoisonSystem* poison) { m_poison = poison; }
    void setPoisonLibrary(const PoisonConfigLibrary* library) { m_library = library; }

    /// Kinds persisted elsewhere; skipped on save and load
    void setIgnoredKinds(const std::vector<BuffKind>& kinds);
    bool isIgnored(BuffKind kind) const;

    /// Enabling registers with the SaveStore, which loads immediately.
    /// Disabling stops the retry loop, saves, unregisters and drops
    /// anything still pending.
    void setEnabled(bool enabled);
    bool isEnabled() const { return m_enabled; }

    void save() override;
    void load() override;

    /// Retry loop body: re-attempt restoration once per tick
    void onTick() override;

    State state() const;
    const std::string& saveKey() const { return m_saveKey; }
    size_t pendingCount() const { return m_pending.size() + m_inFlight.size(); }
    bool hasPendingImmunity() const { return m_pendingImmunity.has_value(); }
    size_t cachedCount() const { return m_cache.size(); }
    bool isRetryLoopRunning() const { return m_retryLoopRunning; }
    uint64_t retryAttempts() const { return m_retryAttempts; }

    /// Default save key for an entity: "buffs_<Name>" or "buffs_<id>"
    static std::string saveKeyFor(const Registry& registry, Entity entity);

private:
    /// Replay pending records if every dependency is ready.
    /// @return true when nothing is left pending
    bool tryRestorePending();

    enum class PoisonRestore {
        NotReady,   // Component not ready, re-queue the record
        Restored,   // Effect (or timer and immunity only) restored
        Inactive    // Saved effect was already spent, drop its timer
    };

    /// Restore the nested poison state of a record
    PoisonRestore restorePoisonRecord(const BuffSaveEntry& record);

    /// Apply a staged record-level immunity once no Poison record waits
    void restorePendingImmunity();

    /// Immunity to persist: staged value first, then the live component
    double immunityToSave();

    bool poisonReady() const;

    void ensureRetryLoop();
    void stopRetryLoop();

    /// Current service, (re)attaching notification handlers if it changed
    BuffTimerService* resolveService();
    void hookService(BuffTimerService* service);
    void unhookService();

    BuffSaveEntry captureEntry(const BuffTimerInstance& instance) const;
    void fillPoisonFields(BuffSaveEntry& entry) const;

    void cacheInstance(const BuffTimerInstance& instance);
    void uncacheInstance(const BuffTimerInstance& instance);

    Registry& m_registry;
    SaveStore& m_store;
    Ticker& m_ticker;
    ServiceProvider m_serviceProvider;
    std::string m_saveKey;

    Entity m_target = NullEntity;
    PoisonSystem* m_poison = nullptr;
    const PoisonConfigLibrary* m_library = nullptr;
    std::unordered_set<int> m_ignoredKinds;

    bool m_enabled = false;
    bool m_retryLoopRunning = false;
    uint64_t m_retryAttempts = 0;
    bool m_restoring = false;
    bool m_missingConfigLogged = false;

    std::vector<BuffSaveEntry> m_pending;
    std::vector<BuffSaveEntry> m_inFlight;  // Being replayed; still saved
    std::optional<double> m_pendingImmunity;
    double m_cachedImmunity = 0.0;
    std::vector<BuffSaveEntry> m_cache;  // Kept in sequence order

    BuffTimerService* m_hookedService = nullptr;
    std::vector<SignalHandlerId> m_instanceHandlers;
    SignalHandlerId m_endedHandler = InvalidSignalHandlerId;
};

} // namespace tickwell
