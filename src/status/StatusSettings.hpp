#pragma once

#include "status/BuffTypes.hpp"
#include "status/BuffTimerService.hpp"
#include "engine/Ticker.hpp"

#include <string>
#include <vector>

namespace tickwell {

class Config;

/// Tunables of the status subsystem, read from the "clock", "buffs",
/// "save", "poison" and "logging" sections of the config file.
struct StatusSettings {
    double tickPeriod = DefaultTickPeriod;
    size_t maxTrackedBuffs = DefaultMaxTrackedBuffs;

    std::string savePath = "saves/status.json";
    std::vector<BuffKind> ignoredKinds;     // Persisted by other systems

    std::string poisonConfigFile = "data/poisons.json";
    std::string poisonDefaultConfigId = "default";

    std::string logFile;
    std::string logLevel = "debug";

    /// Read settings, keeping the defaults above for missing or invalid keys
    static StatusSettings fromConfig(const Config& config);
};

} // namespace tickwell
