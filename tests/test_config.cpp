/**
 * @file test_config.cpp
 * @brief 설정 저장소 / 직렬화 단위 테스트
 *
 * 테스트 대상:
 *   - ConfigCodec: 손상된 JSON 복구, 규칙 필드 기본값
 *   - SettingsConfigStore: 기본값, 변경 알림, 주기 보정, 규칙 편집, 재시작 후 유지
 */

#include <gtest/gtest.h>

#include <QTemporaryDir>

#include <memory>

#include "config/config_codec.h"
#include "config/settings_config_store.h"
#include "test_helpers.h"

using namespace Themis;
using namespace Themis::Config;

// ============================================================
// ConfigCodec 테스트
// ============================================================

// 1. 손상되었거나 배열이 아닌 데이터는 빈 컬렉션
TEST(ConfigCodecTest, CorruptPayloadsDecodeToEmpty) {
    EXPECT_TRUE(ConfigCodec::decodePool("").isEmpty());
    EXPECT_TRUE(ConfigCodec::decodePool("[\"dark\",").isEmpty());
    EXPECT_TRUE(ConfigCodec::decodePool("{\"a\":1}").isEmpty());
    EXPECT_TRUE(ConfigCodec::decodeRules("not json").isEmpty());
    EXPECT_TRUE(ConfigCodec::decodeRules("42").isEmpty());
}

// 2. 풀의 문자열이 아닌 항목은 건너뜀
TEST(ConfigCodecTest, PoolSkipsNonStringEntries) {
    EXPECT_EQ(ConfigCodec::decodePool("[\"dark\", 3, null, \"light\"]"),
              QStringList({"dark", "light"}));
}

// 3. 규칙 한 개를 인코딩/디코딩해도 값이 그대로
TEST(ConfigCodecTest, RulesSurviveEncoding) {
    ScheduleRule rule;
    rule.id = "1700000000000-42";
    rule.name = "야간 \"모드\"";
    rule.themeId = "midnight";
    rule.days = {0, 5, 6};
    rule.start = "22:00";
    rule.end = "06:30";

    const QList<ScheduleRule> decoded =
        ConfigCodec::decodeRules(ConfigCodec::encodeRules({rule}));
    ASSERT_EQ(decoded.size(), 1);
    EXPECT_TRUE(decoded.first() == rule);
}

// 4. 누락 필드와 범위 밖 요일 처리
TEST(ConfigCodecTest, RuleFieldsFallBackToDefaults) {
    const QList<ScheduleRule> rules = ConfigCodec::decodeRules(
        R"([{"id":"r","themeId":"t","days":[6,1,9,-1,1,"x"]}, "junk"])");
    ASSERT_EQ(rules.size(), 1);
    EXPECT_EQ(rules[0].days, QList<int>({6, 1}));
    EXPECT_EQ(rules[0].start, "00:00");
    EXPECT_EQ(rules[0].end, "23:59");
    EXPECT_TRUE(rules[0].name.isEmpty());
}

// 5. 요일은 저장된 순서 그대로 읽힘
TEST(ConfigCodecTest, RuleDaysKeepStoredOrder) {
    ScheduleRule rule;
    rule.id = "r";
    rule.themeId = "t";
    rule.days = {3, 1};
    rule.start = "08:00";
    rule.end = "09:00";

    const QString encoded = ConfigCodec::encodeRules({rule});
    const QList<ScheduleRule> decoded = ConfigCodec::decodeRules(encoded);
    ASSERT_EQ(decoded.size(), 1);
    EXPECT_EQ(decoded[0].days, QList<int>({3, 1}));
    EXPECT_EQ(ConfigCodec::encodeRules(decoded), encoded);
}

// ============================================================
// SettingsConfigStore 테스트
// ============================================================

class SettingsConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.isValid());
        path_ = dir_.filePath("themis.ini");
        store_ = std::make_unique<SettingsConfigStore>(path_);
        QObject::connect(store_.get(), &ConfigStore::changed,
                         [this](const QString& key) { changes_ << key; });
    }

    QTemporaryDir dir_;
    QString path_;
    std::unique_ptr<SettingsConfigStore> store_;
    QStringList changes_;
};

// 6. 아무것도 저장하지 않았을 때의 기본값
TEST_F(SettingsConfigStoreTest, DefaultsMatchDocumentedValues) {
    EXPECT_TRUE(store_->masterEnabled());
    EXPECT_TRUE(store_->manualThemeId().isEmpty());
    EXPECT_FALSE(store_->randomEnabled());
    EXPECT_TRUE(store_->randomPool().isEmpty());
    EXPECT_TRUE(store_->randomOnStartup());
    EXPECT_FALSE(store_->randomIntervalEnabled());
    EXPECT_EQ(store_->randomIntervalMinutes(), 60);
    EXPECT_TRUE(store_->randomAvoidRepeat());
    EXPECT_FALSE(store_->randomCycleMode());
    EXPECT_FALSE(store_->scheduleEnabled());
    EXPECT_TRUE(store_->scheduleRules().isEmpty());
    EXPECT_EQ(store_->scheduleTimezoneOffsetMinutes(), 0);
}

// 7. 값이 바뀔 때만 알림
TEST_F(SettingsConfigStoreTest, NotifiesOnlyOnEffectiveChange) {
    store_->setManualThemeId("dark");
    store_->setManualThemeId("dark");
    store_->setRandomEnabled(true);

    EXPECT_EQ(changes_, QStringList({Keys::ManualThemeId, Keys::RandomEnabled}));
}

// 8. 랜덤 주기는 최소 1분
TEST_F(SettingsConfigStoreTest, IntervalIsClampedToOneMinute) {
    store_->setRandomIntervalMinutes(0);
    EXPECT_EQ(store_->randomIntervalMinutes(), 1);

    store_->setValue(Keys::RandomIntervalMinutes, -30);
    EXPECT_EQ(store_->randomIntervalMinutes(), 1);

    store_->setValue(Keys::RandomIntervalMinutes, "soon");
    EXPECT_EQ(store_->randomIntervalMinutes(), 60);
}

// 9. 손상된 저장 데이터는 빈 컬렉션으로 읽힘
TEST_F(SettingsConfigStoreTest, CorruptStoredCollectionsReadAsEmpty) {
    store_->setValue(Keys::RandomPool, "[[[");
    store_->setValue(Keys::ScheduleRules, "{oops");

    EXPECT_TRUE(store_->randomPool().isEmpty());
    EXPECT_TRUE(store_->scheduleRules().isEmpty());
}

// 10. 풀 토글
TEST_F(SettingsConfigStoreTest, TogglePoolMember) {
    EXPECT_TRUE(store_->togglePoolMember("dark"));
    EXPECT_TRUE(store_->togglePoolMember("light"));
    EXPECT_EQ(store_->randomPool(), QStringList({"dark", "light"}));

    EXPECT_FALSE(store_->togglePoolMember("dark"));
    EXPECT_EQ(store_->randomPool(), QStringList{"light"});
}

// 11. 규칙 추가/수정/삭제 — 순서 유지
TEST_F(SettingsConfigStoreTest, EditsScheduleRulesInPlace) {
    ScheduleRule a;
    a.id = "a";
    a.themeId = "work";
    a.days = {1, 2, 3, 4, 5};
    a.start = "09:00";
    a.end = "17:00";
    ScheduleRule b = a;
    b.id = "b";
    b.themeId = "night";

    ASSERT_TRUE(store_->addScheduleRule(a));
    ASSERT_TRUE(store_->addScheduleRule(b));
    EXPECT_FALSE(store_->addScheduleRule(a)) << "같은 ID는 추가 불가";

    a.themeId = "focus";
    EXPECT_TRUE(store_->updateScheduleRule(a));
    QList<ScheduleRule> rules = store_->scheduleRules();
    ASSERT_EQ(rules.size(), 2);
    EXPECT_EQ(rules[0].id, "a");
    EXPECT_EQ(rules[0].themeId, "focus");
    EXPECT_EQ(rules[1].id, "b");

    EXPECT_TRUE(store_->removeScheduleRule("a"));
    EXPECT_FALSE(store_->removeScheduleRule("a"));
    rules = store_->scheduleRules();
    ASSERT_EQ(rules.size(), 1);
    EXPECT_EQ(rules[0].id, "b");
}

// 12. 파일에 저장된 값은 새 인스턴스에서도 유지
TEST_F(SettingsConfigStoreTest, ValuesPersistAcrossInstances) {
    store_->setMasterEnabled(false);
    store_->setRandomPool({"dark", "light"});
    store_->setScheduleTimezoneOffsetMinutes(-300);
    store_->setRandomCycleMode(true);
    store_.reset();

    SettingsConfigStore reopened(path_);
    EXPECT_FALSE(reopened.masterEnabled());
    EXPECT_EQ(reopened.randomPool(), QStringList({"dark", "light"}));
    EXPECT_EQ(reopened.scheduleTimezoneOffsetMinutes(), -300);
    EXPECT_TRUE(reopened.randomCycleMode());

    const RandomizationConfig cfg = reopened.randomizationConfig();
    EXPECT_TRUE(cfg.cycleMode);
    EXPECT_EQ(cfg.pool, QStringList({"dark", "light"}));
}
