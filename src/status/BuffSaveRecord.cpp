#include "status/BuffSaveRecord.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace tickwell {

nlohmann::json toJson(const BuffSaveEntry& entry) {
    const BuffDefinition& def = entry.definition;
    nlohmann::json j = {
        {"kind", def.kind},
        {"duration_seconds", def.durationSeconds},
        {"recurring_interval_seconds", def.recurringIntervalSeconds},
        {"is_recurring", def.isRecurring},
        {"show_expiry_warning", def.showExpiryWarning},
        {"expiry_warning_ticks", def.expiryWarningTicks},
        {"source_type", entry.sourceType},
        {"source_id", entry.sourceId},
        {"remaining_ticks", entry.remainingTicks},
        {"poison_config_id", entry.poisonConfigId},
        {"poison_current_damage", entry.poisonCurrentDamage},
        {"poison_ticks_since_decay", entry.poisonTicksSinceDecay},
        {"poison_time_to_next_tick", entry.poisonTimeToNextTick},
        {"poison_immunity_timer", entry.poisonImmunityTimer},
    };
    if (!def.displayName.empty()) j["display_name"] = def.displayName;
    if (!def.iconId.empty()) j["icon_id"] = def.iconId;
    return j;
}

std::optional<BuffSaveEntry> parseBuffSaveEntry(const nlohmann::json& json) {
    if (!json.is_object()) {
        SAVE_LOG_WARN("Buff record entry is not an object, skipping");
        return std::nullopt;
    }

    auto kindIt = json.find("kind");
    std::string kindName = (kindIt != json.end() && kindIt->is_string()) ? kindIt->get<std::string>() : "";
    auto kind = parseBuffKind(kindName);
    if (!kind) {
        SAVE_LOG_WARN("Buff record references unknown kind '{}', skipping", kindName);
        return std::nullopt;
    }

    try {
        BuffSaveEntry entry;
        BuffDefinition& def = entry.definition;
        def.kind = *kind;
        def.displayName = json.value("display_name", "");
        def.iconId = json.value("icon_id", "");
        def.durationSeconds = json.value("duration_seconds", 0.0);
        def.recurringIntervalSeconds = json.value("recurring_interval_seconds", 0.0);
        def.isRecurring = json.value("is_recurring", false);
        def.showExpiryWarning = json.value("show_expiry_warning", false);
        def.expiryWarningTicks = json.value("expiry_warning_ticks", 0);

        entry.sourceType = json.value("source_type", BuffSourceType::Scripted);
        entry.sourceId = json.value("source_id", "");
        entry.remainingTicks = json.value("remaining_ticks", IndefiniteTicks);

        if (*kind == BuffKind::Poison) {
            entry.poisonConfigId = json.value("poison_config_id", "");
            entry.poisonCurrentDamage = json.value("poison_current_damage", 0);
            entry.poisonTicksSinceDecay = json.value("poison_ticks_since_decay", 0);
            entry.poisonTimeToNextTick = json.value("poison_time_to_next_tick", 0.0);
            entry.poisonImmunityTimer = json.value("poison_immunity_timer", 0.0);
        }
        return entry;
    } catch (const nlohmann::json::exception& ex) {
        SAVE_LOG_WARN("Malformed {} buff record entry: {}", kindName, ex.what());
        return std::nullopt;
    }
}

nlohmann::json makeBuffSaveRecord(const std::vector<BuffSaveEntry>& entries, double poisonImmunity) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& entry : entries) {
        list.push_back(toJson(entry));
    }
    nlohmann::json record = {{"version", BuffRecordVersion}, {"entries", std::move(list)}};
    if (poisonImmunity > 0.0) {
        record["poison_immunity_timer"] = poisonImmunity;
    }
    return record;
}

std::vector<BuffSaveEntry> parseBuffSaveRecord(const nlohmann::json& record) {
    std::vector<BuffSaveEntry> entries;
    if (!record.is_object()) {
        SAVE_LOG_WARN("Buff record is not an object, ignoring");
        return entries;
    }

    int version = record.value("version", 0);
    if (version != BuffRecordVersion) {
        SAVE_LOG_WARN("Buff record has version {} (expected {}), ignoring", version, BuffRecordVersion);
        return entries;
    }

    auto it = record.find("entries");
    if (it == record.end() || !it->is_array()) {
        return entries;
    }
    for (const auto& json : *it) {
        if (auto entry = parseBuffSaveEntry(json)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

std::optional<double> parsePoisonImmunity(const nlohmann::json& record) {
    if (!record.is_object() || record.value("version", 0) != BuffRecordVersion) {
        return std::nullopt;
    }
    auto it = record.find("poison_immunity_timer");
    if (it == record.end() || !it->is_number()) {
        return std::nullopt;
    }
    return std::max(0.0, it->get<double>());
}

} // namespace tickwell
