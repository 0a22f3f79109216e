#include "status/BuffTypes.hpp"

#include <algorithm>
#include <cmath>

namespace tickwell {

namespace {

int64_t secondsToTicks(double seconds, double tickPeriod) {
    if (tickPeriod <= 0.0) tickPeriod = 1.0;
    auto ticks = static_cast<int64_t>(std::ceil(seconds / tickPeriod));
    return std::max<int64_t>(1, ticks);
}

double sanitize(double value) {
    return std::isfinite(value) && value > 0.0 ? value : 0.0;
}

} // namespace

const char* buffKindToString(BuffKind kind) {
    switch (kind) {
        case BuffKind::Poison:        return "Poison";
        case BuffKind::Venom:         return "Venom";
        case BuffKind::Antifire:      return "Antifire";
        case BuffKind::SuperAntifire: return "SuperAntifire";
        case BuffKind::Overload:      return "Overload";
        case BuffKind::Freeze:        return "Freeze";
        case BuffKind::Stamina:       return "Stamina";
        case BuffKind::PrayerRenewal: return "PrayerRenewal";
        case BuffKind::Custom:        return "Custom";
    }
    return "Custom";
}

const char* buffSourceTypeToString(BuffSourceType type) {
    switch (type) {
        case BuffSourceType::Combat:      return "Combat";
        case BuffSourceType::Potion:      return "Potion";
        case BuffSourceType::Equipment:   return "Equipment";
        case BuffSourceType::Skill:       return "Skill";
        case BuffSourceType::Environment: return "Environment";
        case BuffSourceType::Scripted:    return "Scripted";
    }
    return "Scripted";
}

const char* buffEndReasonToString(BuffEndReason reason) {
    return reason == BuffEndReason::Expired ? "expired" : "manual";
}

std::optional<BuffKind> parseBuffKind(const std::string& name) {
    static const BuffKind kinds[] = {
        BuffKind::Poison, BuffKind::Venom, BuffKind::Antifire,
        BuffKind::SuperAntifire, BuffKind::Overload, BuffKind::Freeze,
        BuffKind::Stamina, BuffKind::PrayerRenewal, BuffKind::Custom
    };
    for (BuffKind kind : kinds) {
        if (name == buffKindToString(kind)) return kind;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// BuffDefinition
// ---------------------------------------------------------------------------

int64_t BuffDefinition::durationTicks(double tickPeriod) const {
    double seconds = sanitize(durationSeconds);
    if (seconds <= 0.0) return IndefiniteTicks;
    return secondsToTicks(seconds, tickPeriod);
}

int64_t BuffDefinition::intervalTicks(double tickPeriod) const {
    double interval = sanitize(recurringIntervalSeconds);
    double seconds = interval > 0.0 ? interval : sanitize(durationSeconds);
    if (seconds <= 0.0) return 1;
    return secondsToTicks(seconds, tickPeriod);
}

std::string BuffDefinition::resolveDisplayName() const {
    return displayName.empty() ? buffKindToString(kind) : displayName;
}

BuffDefinition BuffDefinition::normalized() const {
    BuffDefinition copy = *this;
    copy.durationSeconds = sanitize(durationSeconds);
    copy.recurringIntervalSeconds = sanitize(recurringIntervalSeconds);
    copy.expiryWarningTicks = std::max(0, expiryWarningTicks);
    return copy;
}

} // namespace tickwell
