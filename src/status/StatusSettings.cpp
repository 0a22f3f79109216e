#include "status/StatusSettings.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

namespace tickwell {

StatusSettings StatusSettings::fromConfig(const Config& config) {
    StatusSettings settings;

    double period = config.getDouble("clock.tick_period", settings.tickPeriod);
    if (period > 0.0) {
        settings.tickPeriod = period;
    } else {
        LOG_WARN("clock.tick_period must be positive (got {}), using {}", period, settings.tickPeriod);
    }

    int maxTracked = config.getInt("buffs.max_tracked", static_cast<int>(settings.maxTrackedBuffs));
    if (maxTracked > 0) {
        settings.maxTrackedBuffs = static_cast<size_t>(maxTracked);
    }

    settings.savePath = config.getString("save.path", settings.savePath);
    for (const auto& name : config.getStringList("save.ignored_kinds")) {
        auto kind = parseBuffKind(name);
        if (!kind) {
            LOG_WARN("save.ignored_kinds: unknown buff kind '{}'", name);
            continue;
        }
        settings.ignoredKinds.push_back(*kind);
    }

    settings.poisonConfigFile = config.getString("poison.config_file", settings.poisonConfigFile);
    settings.poisonDefaultConfigId = config.getString("poison.default_config_id", settings.poisonDefaultConfigId);

    settings.logFile = config.getString("logging.file", settings.logFile);
    settings.logLevel = config.getString("logging.level", settings.logLevel);
    return settings;
}

} // namespace tickwell
