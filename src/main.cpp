#include "engine/Config.hpp"
#include "engine/Log.hpp"
#include "engine/Ticker.hpp"
#include "ecs/Registry.hpp"
#include "ecs/Components.hpp"
#include "save/SaveStore.hpp"
#include "status/StatusSettings.hpp"
#include "status/BuffTimerService.hpp"
#include "status/BuffStateSaveBridge.hpp"
#include "status/poison/PoisonConfigLibrary.hpp"
#include "status/poison/PoisonSystem.hpp"

#include <memory>
#include <string>

using namespace tickwell;

namespace {

void logBuffs(const BuffTimerService& service, Entity entity) {
    for (const auto& buff : service.getBuffsFor(entity)) {
        LOG_INFO("  {} ({}): {} tick(s) left", buff->displayName(), buffSourceTypeToString(buff->sourceType()),
                 buff->remainingTicks());
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";

    Config config;
    bool configLoaded = config.loadFromFile(configPath);
    StatusSettings settings = StatusSettings::fromConfig(config);

    Log::init(settings.logFile, settings.logLevel);
    if (!configLoaded) {
        LOG_WARN("Could not load '{}', using default settings", configPath);
    }
    LOG_INFO("Tickwell status demo (tick period {:.2f}s)", settings.tickPeriod);

    PoisonConfigLibrary poisons;
    if (!poisons.loadFromFile(settings.poisonConfigFile)) {
        LOG_WARN("No poison configs in '{}', using the built-in default", settings.poisonConfigFile);
        PoisonConfig fallback;
        fallback.id = settings.poisonDefaultConfigId;
        fallback.startDamagePerTick = 4;
        fallback.tickIntervalSeconds = 3.0;
        fallback.hitsPerDecayStep = 4;
        fallback.decayAmountPerStep = 1;
        poisons.registerConfig(fallback);
    }
    poisons.setCanonicalId(settings.poisonDefaultConfigId);

    Registry registry;
    Ticker ticker(settings.tickPeriod);
    auto service = std::make_unique<BuffTimerService>(settings.tickPeriod, settings.maxTrackedBuffs);
    ticker.subscribe(service.get());

    PoisonSystem poisonSystem(registry, service.get(), settings.tickPeriod);
    ticker.subscribe(&poisonSystem);

    Entity player = registry.create();
    registry.add<Name>(player, "player");
    registry.add<Health>(player, 99);
    registry.add<PoisonStatus>(player);

    service->onEnded().connect([](const BuffTimerInstance& buff, BuffEndReason reason) {
        LOG_INFO("{} ended ({})", buff.displayName(), buffEndReasonToString(reason));
    });
    service->onWarning().connect([](const BuffTimerInstance& buff) {
        LOG_INFO("{} is about to expire", buff.displayName());
    });
    poisonSystem.onPoisonTick().connect([&registry](Entity entity, int damage) {
        const auto* health = registry.tryGet<Health>(entity);
        LOG_INFO("Poison hit for {} (hp {})", damage, health ? health->current : 0);
    });

    SaveStore store(settings.savePath);
    BuffStateSaveBridge bridge(registry, store, ticker,
        [&service]() { return service.get(); },
        BuffStateSaveBridge::saveKeyFor(registry, player));
    bridge.setTarget(player);
    bridge.setPoisonSystem(&poisonSystem);
    bridge.setPoisonLibrary(&poisons);
    bridge.setIgnoredKinds(settings.ignoredKinds);
    bridge.setEnabled(true);

    if (service->getBuffsFor(player).empty()) {
        LOG_INFO("No saved buffs, applying a fresh set");

        BuffEventContext antifire;
        antifire.entity = player;
        antifire.definition.kind = BuffKind::Antifire;
        antifire.definition.durationSeconds = 360.0;
        antifire.definition.showExpiryWarning = true;
        antifire.sourceType = BuffSourceType::Potion;
        antifire.sourceId = "antifire_potion";
        service->apply(antifire);

        BuffEventContext renewal;
        renewal.entity = player;
        renewal.definition.kind = BuffKind::PrayerRenewal;
        renewal.definition.durationSeconds = 6.0;
        renewal.definition.isRecurring = true;
        renewal.sourceType = BuffSourceType::Skill;
        service->apply(renewal);

        if (const PoisonConfig* poison = poisons.canonical()) {
            poisonSystem.applyPoison(player, *poison);
        }
    } else {
        LOG_INFO("Resumed saved buffs:");
        logBuffs(*service, player);
    }

    // Simulate 30 seconds at 60 frames per second
    const double frameTime = 1.0 / 60.0;
    for (int frame = 0; frame < 30 * 60; ++frame) {
        poisonSystem.update(frameTime);
        ticker.update(frameTime);
    }

    LOG_INFO("After {} ticks:", ticker.tickCount());
    logBuffs(*service, player);

    bridge.setEnabled(false);

    ticker.unsubscribe(&poisonSystem);
    ticker.unsubscribe(service.get());
    Log::shutdown();
    return 0;
}
