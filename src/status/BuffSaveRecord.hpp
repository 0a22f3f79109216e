#pragma once

#include "status/BuffTypes.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tickwell {

/// Version tag of the per-entity buff record
constexpr int BuffRecordVersion = 1;

/// Persisted state of one buff timer. The poison_* fields carry the nested
/// poison state machine and are zero / empty for every other kind.
struct BuffSaveEntry {
    BuffDefinition definition;
    BuffSourceType sourceType = BuffSourceType::Scripted;
    std::string sourceId;
    int64_t remainingTicks = IndefiniteTicks;

    std::string poisonConfigId;
    int poisonCurrentDamage = 0;
    int poisonTicksSinceDecay = 0;
    double poisonTimeToNextTick = 0.0;
    double poisonImmunityTimer = 0.0;

    BuffKind kind() const { return definition.kind; }
};

nlohmann::json toJson(const BuffSaveEntry& entry);

/// Parse one entry. Returns std::nullopt (and logs) for unknown kinds or
/// malformed entries.
std::optional<BuffSaveEntry> parseBuffSaveEntry(const nlohmann::json& json);

/// Wrap entries into a versioned record: { "version": 1, "entries": [...] }.
/// A positive `poisonImmunity` is stored at record level as
/// "poison_immunity_timer", so immunity survives without a Poison entry.
nlohmann::json makeBuffSaveRecord(const std::vector<BuffSaveEntry>& entries, double poisonImmunity = 0.0);

/// Unwrap a record. A record with a different version, or one that is not an
/// object, yields no entries.
std::vector<BuffSaveEntry> parseBuffSaveRecord(const nlohmann::json& record);

/// Record-level poison immunity, or std::nullopt when the record carries
/// none (or is not a readable version 1 record)
std::optional<double> parsePoisonImmunity(const nlohmann::json& record);

} // namespace tickwell
