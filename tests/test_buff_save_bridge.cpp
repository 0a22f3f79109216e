#include <gtest/gtest.h>
#include "status/BuffStateSaveBridge.hpp"
#include "status/poison/PoisonSystem.hpp"
#include "status/poison/PoisonConfigLibrary.hpp"
#include "save/SaveStore.hpp"
#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"

#include <map>
#include <memory>
#include <vector>

using namespace tickwell;

class BuffSaveBridgeTest : public ::testing::Test {
protected:
    Registry registry;
    Ticker ticker{1.0};
    SaveStore store;
    std::unique_ptr<BuffTimerService> service = std::make_unique<BuffTimerService>(1.0);
    bool serviceAvailable = true;
    PoisonSystem poison{registry, nullptr, 1.0};
    PoisonConfigLibrary library;
    Entity player = NullEntity;
    std::unique_ptr<BuffStateSaveBridge> bridge;

    void SetUp() override {
        player = registry.create();
        registry.add<Name>(player, "player");
        registry.add<Health>(player, 50);
        registry.add<PoisonStatus>(player);
        poison.setService(service.get());

        PoisonConfig canonical;
        canonical.id = "default";
        canonical.startDamagePerTick = 3;
        canonical.tickIntervalSeconds = 2.0;
        canonical.hitsPerDecayStep = 2;
        canonical.decayAmountPerStep = 1;
        library.registerConfig(canonical);

        PoisonConfig weak = canonical;
        weak.id = "weak";
        weak.startDamagePerTick = 1;
        library.registerConfig(weak);

        bridge = makeBridge(player);
    }

    std::unique_ptr<BuffStateSaveBridge> makeBridge(Entity target) {
        auto b = std::make_unique<BuffStateSaveBridge>(registry, store, ticker,
            [this]() { return serviceAvailable ? service.get() : nullptr; }, "buffs_player");
        b->setTarget(target);
        b->setPoisonSystem(&poison);
        b->setPoisonLibrary(&library);
        return b;
    }

    static BuffSaveEntry antifireEntry(int64_t remaining) {
        BuffSaveEntry entry;
        entry.definition.kind = BuffKind::Antifire;
        entry.definition.durationSeconds = 60.0;
        entry.sourceType = BuffSourceType::Potion;
        entry.sourceId = "antifire_potion";
        entry.remainingTicks = remaining;
        return entry;
    }

    static BuffSaveEntry renewalEntry(int64_t remaining) {
        BuffSaveEntry entry;
        entry.definition.kind = BuffKind::PrayerRenewal;
        entry.definition.isRecurring = true;
        entry.definition.recurringIntervalSeconds = 5.0;
        entry.sourceType = BuffSourceType::Skill;
        entry.remainingTicks = remaining;
        return entry;
    }

    BuffSaveEntry poisonEntry(const std::string& configId = "default") const {
        BuffSaveEntry entry;
        entry.definition = PoisonSystem::makeBuffDefinition(*library.resolve("default"), 12.0);
        entry.sourceType = BuffSourceType::Combat;
        entry.sourceId = "default";
        entry.remainingTicks = 7;
        entry.poisonConfigId = configId;
        entry.poisonCurrentDamage = 2;
        entry.poisonTicksSinceDecay = 1;
        entry.poisonTimeToNextTick = 0.5;
        entry.poisonImmunityTimer = 0.0;
        return entry;
    }

    void seed(const std::vector<BuffSaveEntry>& entries) {
        store.save("buffs_player", makeBuffSaveRecord(entries));
    }

    std::vector<BuffSaveEntry> savedEntries() {
        auto record = store.load("buffs_player");
        return record ? parseBuffSaveRecord(*record) : std::vector<BuffSaveEntry>{};
    }

    void setPoisonEnabled(bool enabled) {
        registry.get<PoisonStatus>(player).enabled = enabled;
    }
};

// ============================================================================
// Round trips
// ============================================================================

TEST_F(BuffSaveBridgeTest, RecurringCountdownSurvivesRoundTrip) {
    bridge->setEnabled(true);

    BuffEventContext ctx;
    ctx.entity = player;
    ctx.definition = renewalEntry(0).definition;
    service->apply(ctx);
    for (int i = 0; i < 3; ++i) service->onTick();
    ASSERT_EQ(service->tryGetBuff(player, BuffKind::PrayerRenewal)->remainingTicks(), 2);

    bridge->save();
    service->clear();

    int started = 0;
    service->onStarted().connect([&](const BuffTimerInstance&) { ++started; });
    bridge->load();

    auto buff = service->tryGetBuff(player, BuffKind::PrayerRenewal);
    ASSERT_NE(buff, nullptr);
    EXPECT_EQ(buff->remainingTicks(), 2);
    EXPECT_EQ(buff->intervalTicks(), 5);
    EXPECT_EQ(started, 0);
}

TEST_F(BuffSaveBridgeTest, RestoreOnEnableWithExactCountdowns) {
    seed({antifireEntry(17), renewalEntry(4)});

    bridge->setEnabled(true);

    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_FALSE(bridge->isRetryLoopRunning());
    EXPECT_EQ(service->tryGetBuff(player, BuffKind::Antifire)->remainingTicks(), 17);
    EXPECT_EQ(service->tryGetBuff(player, BuffKind::Antifire)->sourceId(), "antifire_potion");
    EXPECT_EQ(service->tryGetBuff(player, BuffKind::PrayerRenewal)->remainingTicks(), 4);
}

TEST_F(BuffSaveBridgeTest, PoisonStateIsCapturedOnSave) {
    bridge->setEnabled(true);
    ASSERT_TRUE(poison.applyPoison(player, *library.canonical()));
    for (int i = 0; i < 3; ++i) poison.onTick();
    poison.setImmunity(player, 4.0);

    bridge->save();

    auto entries = savedEntries();
    ASSERT_EQ(entries.size(), 1u);
    const auto& entry = entries[0];
    EXPECT_EQ(entry.kind(), BuffKind::Poison);
    EXPECT_EQ(entry.remainingTicks, 12);
    EXPECT_EQ(entry.poisonConfigId, "default");
    EXPECT_EQ(entry.poisonCurrentDamage, 3);
    EXPECT_EQ(entry.poisonTicksSinceDecay, 1);
    EXPECT_DOUBLE_EQ(entry.poisonTimeToNextTick, 1.0);
    EXPECT_DOUBLE_EQ(entry.poisonImmunityTimer, 4.0);
}

TEST_F(BuffSaveBridgeTest, PoisonStateIsRestored) {
    seed({poisonEntry()});
    registry.get<PoisonStatus>(player).immunityTimer = 0.0;

    bridge->setEnabled(true);

    const auto& status = registry.get<PoisonStatus>(player);
    ASSERT_TRUE(status.isPoisoned());
    EXPECT_EQ(status.effect->config().id, "default");
    EXPECT_EQ(status.effect->currentDamage(), 2);
    EXPECT_EQ(status.effect->ticksSinceDecay(), 1);
    EXPECT_DOUBLE_EQ(status.effect->tickTimer(), 1.5);
    EXPECT_EQ(status.ticksUntilNextDamage, 1);

    auto buff = service->tryGetBuff(player, BuffKind::Poison);
    ASSERT_NE(buff, nullptr);
    EXPECT_EQ(buff->remainingTicks(), 7);
    EXPECT_EQ(registry.get<Health>(player).current, 50);
}

// ============================================================================
// Deferred restoration
// ============================================================================

TEST_F(BuffSaveBridgeTest, DeferredRestoreAppliesEachRecordExactlyOnce) {
    seed({antifireEntry(30), poisonEntry()});
    setPoisonEnabled(false);

    std::map<BuffKind, int> restored;
    service->onRestored().connect([&](const BuffTimerInstance& b) { ++restored[b.kind()]; });

    bridge->setEnabled(true);
    EXPECT_EQ(bridge->state(), BuffStateSaveBridge::State::Deferred);
    EXPECT_EQ(bridge->pendingCount(), 2u);
    EXPECT_TRUE(bridge->isRetryLoopRunning());

    for (int i = 0; i < 25; ++i) {
        ticker.tick();
    }
    // Nothing is restored while the poison component is not ready, not
    // even the unrelated record
    EXPECT_TRUE(restored.empty());
    EXPECT_EQ(bridge->pendingCount(), 2u);
    EXPECT_EQ(bridge->retryAttempts(), 25u);
    EXPECT_EQ(ticker.subscriberCount(), 1u);

    setPoisonEnabled(true);
    ticker.tick();

    EXPECT_EQ(restored[BuffKind::Antifire], 1);
    EXPECT_EQ(restored[BuffKind::Poison], 1);
    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_FALSE(bridge->isRetryLoopRunning());
    EXPECT_EQ(ticker.subscriberCount(), 0u);
    EXPECT_TRUE(registry.get<PoisonStatus>(player).isPoisoned());

    for (int i = 0; i < 5; ++i) {
        ticker.tick();
    }
    EXPECT_EQ(restored[BuffKind::Antifire], 1);
    EXPECT_EQ(restored[BuffKind::Poison], 1);
}

TEST_F(BuffSaveBridgeTest, DeadTargetDefersPoisonRestore) {
    seed({poisonEntry()});
    registry.get<Health>(player).current = 0;

    bridge->setEnabled(true);
    ticker.tick();
    EXPECT_EQ(bridge->pendingCount(), 1u);

    registry.get<Health>(player).current = 10;
    ticker.tick();
    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_NE(service->tryGetBuff(player, BuffKind::Poison), nullptr);
}

TEST_F(BuffSaveBridgeTest, MissingServiceDefersUntilConstructed) {
    seed({antifireEntry(9)});
    serviceAvailable = false;

    bridge->setEnabled(true);
    ticker.tick();
    ticker.tick();
    EXPECT_EQ(bridge->pendingCount(), 1u);
    EXPECT_EQ(service->activeCount(), 0u);

    serviceAvailable = true;
    ticker.tick();
    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_EQ(service->tryGetBuff(player, BuffKind::Antifire)->remainingTicks(), 9);
}

TEST_F(BuffSaveBridgeTest, MissingTargetDefersUntilSet) {
    bridge.reset();
    seed({antifireEntry(9)});
    bridge = makeBridge(NullEntity);

    bridge->setEnabled(true);
    ticker.tick();
    EXPECT_EQ(bridge->pendingCount(), 1u);

    bridge->setTarget(player);
    ticker.tick();
    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_NE(service->tryGetBuff(player, BuffKind::Antifire), nullptr);
}

TEST_F(BuffSaveBridgeTest, RepeatedLoadDoesNotDuplicateWork) {
    seed({antifireEntry(30), poisonEntry()});
    setPoisonEnabled(false);
    bridge->setEnabled(true);

    store.loadAll();
    bridge->load();
    EXPECT_EQ(bridge->pendingCount(), 2u);
    EXPECT_EQ(ticker.subscriberCount(), 1u);
}

TEST_F(BuffSaveBridgeTest, SaveWhileDeferredKeepsPendingRecords) {
    seed({antifireEntry(30), poisonEntry()});
    setPoisonEnabled(false);
    bridge->setEnabled(true);

    bridge->save();

    auto entries = savedEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].kind(), BuffKind::Antifire);
    EXPECT_EQ(entries[0].remainingTicks, 30);
    EXPECT_EQ(entries[1].kind(), BuffKind::Poison);
    EXPECT_EQ(entries[1].poisonCurrentDamage, 2);
}

TEST_F(BuffSaveBridgeTest, DisableStopsRetryLoopAndKeepsRecord) {
    seed({antifireEntry(30), poisonEntry()});
    setPoisonEnabled(false);
    bridge->setEnabled(true);
    ASSERT_TRUE(bridge->isRetryLoopRunning());

    bridge->setEnabled(false);
    EXPECT_FALSE(bridge->isRetryLoopRunning());
    EXPECT_EQ(ticker.subscriberCount(), 0u);
    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_EQ(store.saveableCount(), 0u);
    EXPECT_EQ(savedEntries().size(), 2u);

    setPoisonEnabled(true);
    ticker.tick();
    EXPECT_EQ(service->activeCount(), 0u);
}

TEST_F(BuffSaveBridgeTest, DestroyingBridgeStopsRetryLoop) {
    seed({poisonEntry()});
    setPoisonEnabled(false);
    bridge->setEnabled(true);
    ASSERT_EQ(ticker.subscriberCount(), 1u);

    bridge.reset();
    EXPECT_EQ(ticker.subscriberCount(), 0u);
    EXPECT_EQ(store.saveableCount(), 0u);
    EXPECT_NO_THROW(ticker.tick());
}

TEST_F(BuffSaveBridgeTest, RequeuedPoisonRecordRestoresOnceAfterRevival) {
    seed({antifireEntry(30), poisonEntry()});

    std::map<BuffKind, int> restored;
    std::vector<BuffStateSaveBridge::State> statesSeen;
    service->onRestored().connect([&](const BuffTimerInstance& b) {
        ++restored[b.kind()];
        statesSeen.push_back(bridge->state());
        if (b.kind() == BuffKind::Antifire) {
            registry.get<Health>(player).current = 0;
        }
    });

    bridge->setEnabled(true);

    ASSERT_EQ(statesSeen.size(), 1u);
    EXPECT_EQ(statesSeen[0], BuffStateSaveBridge::State::Restoring);
    EXPECT_EQ(restored[BuffKind::Antifire], 1);
    EXPECT_EQ(restored[BuffKind::Poison], 0);
    EXPECT_EQ(bridge->pendingCount(), 1u);
    EXPECT_EQ(bridge->state(), BuffStateSaveBridge::State::Deferred);
    EXPECT_TRUE(bridge->isRetryLoopRunning());
    EXPECT_FALSE(registry.get<PoisonStatus>(player).isPoisoned());

    // The re-queued record is still part of the saved state
    bridge->save();
    ASSERT_EQ(savedEntries().size(), 2u);
    EXPECT_EQ(savedEntries()[1].kind(), BuffKind::Poison);

    for (int i = 0; i < 3; ++i) {
        ticker.tick();
    }
    EXPECT_EQ(bridge->pendingCount(), 1u);
    EXPECT_EQ(ticker.subscriberCount(), 1u);

    registry.get<Health>(player).current = 10;
    ticker.tick();

    EXPECT_EQ(restored[BuffKind::Antifire], 1);
    EXPECT_EQ(restored[BuffKind::Poison], 1);
    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_FALSE(bridge->isRetryLoopRunning());
    EXPECT_TRUE(registry.get<PoisonStatus>(player).isPoisoned());
}

TEST_F(BuffSaveBridgeTest, SaveDuringReplayKeepsUnreachedRecords) {
    seed({antifireEntry(30), renewalEntry(4)});

    std::vector<BuffSaveEntry> midReplay;
    service->onRestored().connect([&](const BuffTimerInstance& b) {
        if (b.kind() == BuffKind::Antifire) {
            store.saveAll();
            midReplay = savedEntries();
        }
    });

    bridge->setEnabled(true);

    ASSERT_EQ(midReplay.size(), 2u);
    EXPECT_EQ(midReplay[0].kind(), BuffKind::Antifire);
    EXPECT_EQ(midReplay[0].remainingTicks, 30);
    EXPECT_EQ(midReplay[1].kind(), BuffKind::PrayerRenewal);
    EXPECT_EQ(midReplay[1].remainingTicks, 4);

    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_NE(service->tryGetBuff(player, BuffKind::PrayerRenewal), nullptr);
}

// ============================================================================
// Capture cache
// ============================================================================

TEST_F(BuffSaveBridgeTest, SaveFallsBackToCacheWhenServiceUnavailable) {
    bridge->setEnabled(true);
    EXPECT_EQ(bridge->state(), BuffStateSaveBridge::State::Capturing);

    BuffEventContext antifire;
    antifire.entity = player;
    antifire.definition = antifireEntry(0).definition;
    service->apply(antifire);

    BuffEventContext renewal;
    renewal.entity = player;
    renewal.definition = renewalEntry(0).definition;
    service->apply(renewal);

    service->onTick();
    service->onTick();
    EXPECT_EQ(bridge->cachedCount(), 2u);

    serviceAvailable = false;
    bridge->save();

    auto entries = savedEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].kind(), BuffKind::Antifire);
    EXPECT_EQ(entries[0].remainingTicks, 58);
    EXPECT_EQ(entries[1].kind(), BuffKind::PrayerRenewal);
    EXPECT_EQ(entries[1].remainingTicks, 3);
}

TEST_F(BuffSaveBridgeTest, EndedBuffsLeaveTheCache) {
    bridge->setEnabled(true);

    BuffEventContext ctx;
    ctx.entity = player;
    ctx.definition = antifireEntry(0).definition;
    service->apply(ctx);
    EXPECT_EQ(bridge->cachedCount(), 1u);

    service->remove(player, BuffKind::Antifire);
    EXPECT_EQ(bridge->cachedCount(), 0u);
}

TEST_F(BuffSaveBridgeTest, OtherEntitiesAreNotCached) {
    bridge->setEnabled(true);
    Entity other = registry.create();

    BuffEventContext ctx;
    ctx.entity = other;
    ctx.definition = antifireEntry(0).definition;
    service->apply(ctx);
    EXPECT_EQ(bridge->cachedCount(), 0u);
}

TEST_F(BuffSaveBridgeTest, EmptySnapshotDeletesRecord) {
    seed({antifireEntry(30)});
    bridge->setEnabled(true);
    service->remove(player, BuffKind::Antifire);

    bridge->save();
    EXPECT_FALSE(store.has("buffs_player"));
}

// ============================================================================
// Poison immunity
// ============================================================================

TEST_F(BuffSaveBridgeTest, CuredImmunitySurvivesReload) {
    bridge->setEnabled(true);
    ASSERT_TRUE(poison.applyPoison(player, *library.canonical()));
    poison.curePoison(player, 30.0);
    ASSERT_EQ(service->tryGetBuff(player, BuffKind::Poison), nullptr);

    bridge->save();
    auto record = store.load("buffs_player");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(parseBuffSaveRecord(*record).empty());
    EXPECT_DOUBLE_EQ(parsePoisonImmunity(*record).value_or(0.0), 30.0);

    bridge->setEnabled(false);
    registry.get<PoisonStatus>(player).immunityTimer = 0.0;
    bridge->setEnabled(true);

    EXPECT_DOUBLE_EQ(poison.immunity(player), 30.0);
    EXPECT_FALSE(bridge->hasPendingImmunity());
    EXPECT_FALSE(bridge->isRetryLoopRunning());
    EXPECT_FALSE(poison.applyPoison(player, *library.canonical()));
}

TEST_F(BuffSaveBridgeTest, ImmunityWaitsForPoisonComponent) {
    registry.remove<PoisonStatus>(player);
    store.save("buffs_player", makeBuffSaveRecord({}, 8.0));

    bridge->setEnabled(true);
    EXPECT_TRUE(bridge->hasPendingImmunity());
    EXPECT_EQ(bridge->state(), BuffStateSaveBridge::State::Deferred);
    EXPECT_TRUE(bridge->isRetryLoopRunning());

    bridge->save();
    auto record = store.load("buffs_player");
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(parsePoisonImmunity(*record).value_or(0.0), 8.0);

    registry.add<PoisonStatus>(player);
    ticker.tick();

    EXPECT_DOUBLE_EQ(poison.immunity(player), 8.0);
    EXPECT_FALSE(bridge->hasPendingImmunity());
    EXPECT_FALSE(bridge->isRetryLoopRunning());
}

TEST_F(BuffSaveBridgeTest, SpentPoisonRecordRestoresNoTimer) {
    BuffSaveEntry spent = poisonEntry();
    spent.poisonCurrentDamage = 0;
    spent.poisonImmunityTimer = 5.0;
    seed({antifireEntry(30), spent});

    bridge->setEnabled(true);

    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_FALSE(registry.get<PoisonStatus>(player).isPoisoned());
    EXPECT_EQ(service->tryGetBuff(player, BuffKind::Poison), nullptr);
    EXPECT_NE(service->tryGetBuff(player, BuffKind::Antifire), nullptr);
    EXPECT_DOUBLE_EQ(poison.immunity(player), 5.0);
}

// ============================================================================
// Configuration problems
// ============================================================================

TEST_F(BuffSaveBridgeTest, MissingCanonicalConfigRestoresTimerAndImmunityOnly) {
    library.setCanonicalId("missing");
    BuffSaveEntry entry = poisonEntry();
    entry.poisonImmunityTimer = 12.0;
    seed({entry});

    bridge->setEnabled(true);

    EXPECT_EQ(bridge->pendingCount(), 0u);
    EXPECT_FALSE(registry.get<PoisonStatus>(player).isPoisoned());
    EXPECT_DOUBLE_EQ(poison.immunity(player), 12.0);
    auto buff = service->tryGetBuff(player, BuffKind::Poison);
    ASSERT_NE(buff, nullptr);
    EXPECT_EQ(buff->remainingTicks(), 7);
}

TEST_F(BuffSaveBridgeTest, NonCanonicalConfigIdIsNormalized) {
    seed({poisonEntry("weak")});

    bridge->setEnabled(true);

    const auto& status = registry.get<PoisonStatus>(player);
    ASSERT_TRUE(status.isPoisoned());
    EXPECT_EQ(status.effect->config().id, "default");
}

TEST_F(BuffSaveBridgeTest, IgnoredKindsAreNeitherLoadedNorSaved) {
    seed({antifireEntry(30), renewalEntry(2)});
    bridge->setIgnoredKinds({BuffKind::Antifire});
    EXPECT_TRUE(bridge->isIgnored(BuffKind::Antifire));

    bridge->setEnabled(true);
    EXPECT_EQ(service->tryGetBuff(player, BuffKind::Antifire), nullptr);
    EXPECT_NE(service->tryGetBuff(player, BuffKind::PrayerRenewal), nullptr);

    BuffEventContext ctx;
    ctx.entity = player;
    ctx.definition = antifireEntry(0).definition;
    service->apply(ctx);
    bridge->save();

    auto entries = savedEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind(), BuffKind::PrayerRenewal);
}

TEST_F(BuffSaveBridgeTest, UnknownKindInRecordIsSkipped) {
    auto record = makeBuffSaveRecord({antifireEntry(30)});
    record["entries"].push_back({{"kind", "Teleblock"}, {"remaining_ticks", 3}});
    store.save("buffs_player", record);

    bridge->setEnabled(true);
    EXPECT_EQ(service->activeCount(), 1u);
    EXPECT_EQ(bridge->pendingCount(), 0u);
}

// ============================================================================
// Misc
// ============================================================================

TEST_F(BuffSaveBridgeTest, StartsIdleAndDisabled) {
    EXPECT_FALSE(bridge->isEnabled());
    EXPECT_EQ(bridge->state(), BuffStateSaveBridge::State::Idle);
    EXPECT_EQ(store.saveableCount(), 0u);
}

TEST_F(BuffSaveBridgeTest, SaveAllReachesBridge) {
    bridge->setEnabled(true);

    BuffEventContext ctx;
    ctx.entity = player;
    ctx.definition = antifireEntry(0).definition;
    service->apply(ctx);

    store.saveAll();
    EXPECT_EQ(savedEntries().size(), 1u);
}

TEST_F(BuffSaveBridgeTest, SaveKeyForEntity) {
    EXPECT_EQ(BuffStateSaveBridge::saveKeyFor(registry, player), "buffs_player");

    Entity unnamed = registry.create();
    EXPECT_EQ(BuffStateSaveBridge::saveKeyFor(registry, unnamed),
              "buffs_" + std::to_string(entityId(unnamed)));
}
