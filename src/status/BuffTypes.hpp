#pragma once

#include "ecs/Entity.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tickwell {

/// Sentinel for "no countdown" (indefinite buffs)
constexpr int64_t IndefiniteTicks = -1;

// ============================================================================
// Enumerations
// ============================================================================

/// Buff slot identifier. An entity holds at most one active buff per kind.
enum class BuffKind {
    Poison,
    Venom,
    Antifire,
    SuperAntifire,
    Overload,
    Freeze,
    Stamina,
    PrayerRenewal,
    Custom
};

/// Origin category of a buff, for presentation and auditing only
enum class BuffSourceType {
    Combat,
    Potion,
    Equipment,
    Skill,
    Environment,
    Scripted
};

/// Why a buff ended
enum class BuffEndReason {
    Manual,
    Expired
};

const char* buffKindToString(BuffKind kind);
const char* buffSourceTypeToString(BuffSourceType type);
const char* buffEndReasonToString(BuffEndReason reason);

/// Parse a kind name ("Poison", "SuperAntifire", ...). Case-sensitive.
std::optional<BuffKind> parseBuffKind(const std::string& name);

NLOHMANN_JSON_SERIALIZE_ENUM(BuffKind, {
    {BuffKind::Poison, "Poison"},
    {BuffKind::Venom, "Venom"},
    {BuffKind::Antifire, "Antifire"},
    {BuffKind::SuperAntifire, "SuperAntifire"},
    {BuffKind::Overload, "Overload"},
    {BuffKind::Freeze, "Freeze"},
    {BuffKind::Stamina, "Stamina"},
    {BuffKind::PrayerRenewal, "PrayerRenewal"},
    {BuffKind::Custom, "Custom"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(BuffSourceType, {
    {BuffSourceType::Combat, "Combat"},
    {BuffSourceType::Potion, "Potion"},
    {BuffSourceType::Equipment, "Equipment"},
    {BuffSourceType::Skill, "Skill"},
    {BuffSourceType::Environment, "Environment"},
    {BuffSourceType::Scripted, "Scripted"},
})

// ============================================================================
// BuffDefinition: value type copied into each instance
// ============================================================================

struct BuffDefinition {
    BuffKind kind = BuffKind::Custom;
    std::string displayName;            // Empty = use kind name
    std::string iconId;                 // Presentation only
    double durationSeconds = 0.0;       // 0 = no fixed duration
    double recurringIntervalSeconds = 0.0; // 0 = reuse durationSeconds
    bool isRecurring = false;
    bool showExpiryWarning = false;
    int expiryWarningTicks = 0;         // 0 = derive from duration

    /// Duration in ticks, or IndefiniteTicks when no duration is set.
    int64_t durationTicks(double tickPeriod) const;

    /// Recurring interval in ticks (minimum 1). Falls back to the duration
    /// when no explicit interval is configured.
    int64_t intervalTicks(double tickPeriod) const;

    std::string resolveDisplayName() const;

    /// Copy with negative / non-finite numbers clamped to zero
    BuffDefinition normalized() const;
};

// ============================================================================
// BuffEventContext: payload for apply / refresh / restore
// ============================================================================

struct BuffEventContext {
    Entity entity = NullEntity;
    BuffDefinition definition;
    BuffSourceType sourceType = BuffSourceType::Scripted;
    std::string sourceId;               // Empty = kind name
    bool resetTimer = true;
};

// ============================================================================
// BuffKey: registry uniqueness
// ============================================================================

struct BuffKey {
    Entity entity = NullEntity;
    BuffKind kind = BuffKind::Custom;

    BuffKey() = default;
    BuffKey(Entity e, BuffKind k) : entity(e), kind(k) {}

    bool operator==(const BuffKey& other) const {
        return entity == other.entity && kind == other.kind;
    }
    bool operator!=(const BuffKey& other) const { return !(*this == other); }
};

struct BuffKeyHash {
    size_t operator()(const BuffKey& key) const {
        size_t h = std::hash<uint32_t>{}(entityId(key.entity));
        size_t k = std::hash<int>{}(static_cast<int>(key.kind));
        return h ^ (k + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

} // namespace tickwell
