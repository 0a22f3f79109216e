#include <gtest/gtest.h>
#include "status/BuffSaveRecord.hpp"

using namespace tickwell;

namespace {

BuffSaveEntry poisonEntry() {
    BuffSaveEntry entry;
    entry.definition.kind = BuffKind::Poison;
    entry.definition.displayName = "Poison";
    entry.definition.durationSeconds = 240.0;
    entry.sourceType = BuffSourceType::Combat;
    entry.sourceId = "default";
    entry.remainingTicks = 120;
    entry.poisonConfigId = "default";
    entry.poisonCurrentDamage = 3;
    entry.poisonTicksSinceDecay = 2;
    entry.poisonTimeToNextTick = 0.25;
    entry.poisonImmunityTimer = 1.5;
    return entry;
}

} // anonymous namespace

TEST(BuffSaveRecordTest, EntryJsonShape) {
    BuffSaveEntry entry;
    entry.definition.kind = BuffKind::Antifire;
    entry.definition.durationSeconds = 360.0;
    entry.sourceType = BuffSourceType::Potion;
    entry.sourceId = "antifire_potion";
    entry.remainingTicks = 42;

    auto j = toJson(entry);
    EXPECT_EQ(j["kind"], "Antifire");
    EXPECT_EQ(j["source_type"], "Potion");
    EXPECT_EQ(j["remaining_ticks"], 42);
    EXPECT_EQ(j["is_recurring"], false);
    EXPECT_FALSE(j.contains("display_name"));
    EXPECT_FALSE(j.contains("icon_id"));
    // Non-poison entries carry zeroed poison fields
    EXPECT_EQ(j["poison_current_damage"], 0);
    EXPECT_EQ(j["poison_config_id"], "");
}

TEST(BuffSaveRecordTest, PoisonEntrySurvivesRecord) {
    auto record = makeBuffSaveRecord({poisonEntry()});
    EXPECT_EQ(record["version"], BuffRecordVersion);

    auto entries = parseBuffSaveRecord(record);
    ASSERT_EQ(entries.size(), 1u);
    const auto& entry = entries[0];
    EXPECT_EQ(entry.kind(), BuffKind::Poison);
    EXPECT_EQ(entry.definition.displayName, "Poison");
    EXPECT_EQ(entry.sourceType, BuffSourceType::Combat);
    EXPECT_EQ(entry.remainingTicks, 120);
    EXPECT_EQ(entry.poisonCurrentDamage, 3);
    EXPECT_EQ(entry.poisonTicksSinceDecay, 2);
    EXPECT_DOUBLE_EQ(entry.poisonTimeToNextTick, 0.25);
    EXPECT_DOUBLE_EQ(entry.poisonImmunityTimer, 1.5);
}

TEST(BuffSaveRecordTest, UnknownKindIsSkipped) {
    auto record = makeBuffSaveRecord({poisonEntry()});
    record["entries"].push_back({{"kind", "Teleblock"}, {"remaining_ticks", 5}});
    record["entries"].push_back({{"kind", 7}});
    record["entries"].push_back(nlohmann::json("garbage"));

    EXPECT_EQ(parseBuffSaveRecord(record).size(), 1u);
}

TEST(BuffSaveRecordTest, PoisonFieldsIgnoredForOtherKinds) {
    nlohmann::json entry = {
        {"kind", "Venom"},
        {"remaining_ticks", 10},
        {"poison_current_damage", 6},
    };
    auto parsed = parseBuffSaveEntry(entry);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->poisonCurrentDamage, 0);
}

TEST(BuffSaveRecordTest, MissingFieldsUseDefaults) {
    auto parsed = parseBuffSaveEntry({{"kind", "Freeze"}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->remainingTicks, IndefiniteTicks);
    EXPECT_EQ(parsed->sourceType, BuffSourceType::Scripted);
    EXPECT_DOUBLE_EQ(parsed->definition.durationSeconds, 0.0);
}

TEST(BuffSaveRecordTest, WrongFieldTypeIsSkipped) {
    auto parsed = parseBuffSaveEntry({{"kind", "Freeze"}, {"remaining_ticks", "soon"}});
    EXPECT_FALSE(parsed.has_value());
}

TEST(BuffSaveRecordTest, VersionMismatchYieldsNothing) {
    auto record = makeBuffSaveRecord({poisonEntry()});
    record["version"] = BuffRecordVersion + 1;
    EXPECT_TRUE(parseBuffSaveRecord(record).empty());

    EXPECT_TRUE(parseBuffSaveRecord(nlohmann::json::array()).empty());
    EXPECT_TRUE(parseBuffSaveRecord({{"version", BuffRecordVersion}}).empty());
}

TEST(BuffSaveRecordTest, RecordLevelPoisonImmunity) {
    auto record = makeBuffSaveRecord({}, 30.0);
    EXPECT_TRUE(parseBuffSaveRecord(record).empty());
    ASSERT_TRUE(parsePoisonImmunity(record).has_value());
    EXPECT_DOUBLE_EQ(*parsePoisonImmunity(record), 30.0);

    // No immunity means no field at all
    auto plain = makeBuffSaveRecord({poisonEntry()});
    EXPECT_FALSE(plain.contains("poison_immunity_timer"));
    EXPECT_FALSE(parsePoisonImmunity(plain).has_value());

    record["poison_immunity_timer"] = "long";
    EXPECT_FALSE(parsePoisonImmunity(record).has_value());
    record["poison_immunity_timer"] = -4.0;
    EXPECT_DOUBLE_EQ(*parsePoisonImmunity(record), 0.0);
}
