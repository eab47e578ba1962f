#include "config_store.h"
#include "config_codec.h"

#include <QDebug>

#include <algorithm>

namespace Themis {
namespace Config {

namespace {
constexpr int DEFAULT_INTERVAL_MINUTES = 60;
} // namespace

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

void ConfigStore::setValue(const QString& key, const QVariant& value)
{
    // INI 백엔드는 값을 문자열로 돌려주므로 문자열 표현으로 비교
    const QVariant current = this->value(key, QVariant());
    if (current.isValid() && current.toString() == value.toString()) return;

    storeValue(key, value);
    emit changed(key);
}

// ============================================================
// 일반
// ============================================================

bool ConfigStore::masterEnabled() const
{
    return value(Keys::MasterEnabled, true).toBool();
}

void ConfigStore::setMasterEnabled(bool enabled)
{
    setValue(Keys::MasterEnabled, enabled);
}

QString ConfigStore::manualThemeId() const
{
    return value(Keys::ManualThemeId, QString()).toString();
}

void ConfigStore::setManualThemeId(const QString& themeId)
{
    setValue(Keys::ManualThemeId, themeId);
}

// ============================================================
// 랜덤
// ============================================================

bool ConfigStore::randomEnabled() const
{
    return value(Keys::RandomEnabled, false).toBool();
}

void ConfigStore::setRandomEnabled(bool enabled)
{
    setValue(Keys::RandomEnabled, enabled);
}

QStringList ConfigStore::randomPool() const
{
    return ConfigCodec::decodePool(value(Keys::RandomPool, QStringLiteral("[]")).toString());
}

void ConfigStore::setRandomPool(const QStringList& pool)
{
    setValue(Keys::RandomPool, ConfigCodec::encodePool(pool));
}

bool ConfigStore::togglePoolMember(const QString& themeId)
{
    QStringList pool = randomPool();
    const bool present = pool.contains(themeId);
    if (present) {
        pool.removeAll(themeId);
    } else {
        pool.append(themeId);
    }
    setRandomPool(pool);
    return !present;
}

bool ConfigStore::randomOnStartup() const
{
    return value(Keys::RandomOnStartup, true).toBool();
}

void ConfigStore::setRandomOnStartup(bool enabled)
{
    setValue(Keys::RandomOnStartup, enabled);
}

bool ConfigStore::randomIntervalEnabled() const
{
    return value(Keys::RandomIntervalEnabled, false).toBool();
}

void ConfigStore::setRandomIntervalEnabled(bool enabled)
{
    setValue(Keys::RandomIntervalEnabled, enabled);
}

int ConfigStore::randomIntervalMinutes() const
{
    bool ok = false;
    const int minutes = value(Keys::RandomIntervalMinutes, DEFAULT_INTERVAL_MINUTES).toInt(&ok);
    if (!ok) return DEFAULT_INTERVAL_MINUTES;
    return std::max(1, minutes);
}

void ConfigStore::setRandomIntervalMinutes(int minutes)
{
    setValue(Keys::RandomIntervalMinutes, std::max(1, minutes));
}

bool ConfigStore::randomAvoidRepeat() const
{
    return value(Keys::RandomAvoidRepeat, true).toBool();
}

void ConfigStore::setRandomAvoidRepeat(bool enabled)
{
    setValue(Keys::RandomAvoidRepeat, enabled);
}

bool ConfigStore::randomCycleMode() const
{
    return value(Keys::RandomCycleMode, false).toBool();
}

void ConfigStore::setRandomCycleMode(bool enabled)
{
    setValue(Keys::RandomCycleMode, enabled);
}

RandomizationConfig ConfigStore::randomizationConfig() const
{
    RandomizationConfig config;
    config.enabled = randomEnabled();
    config.pool = randomPool();
    config.onStartup = randomOnStartup();
    config.intervalEnabled = randomIntervalEnabled();
    config.intervalMinutes = randomIntervalMinutes();
    config.avoidRepeat = randomAvoidRepeat();
    config.cycleMode = randomCycleMode();
    return config;
}

// ============================================================
// 스케줄
// ============================================================

bool ConfigStore::scheduleEnabled() const
{
    return value(Keys::ScheduleEnabled, false).toBool();
}

void ConfigStore::setScheduleEnabled(bool enabled)
{
    setValue(Keys::ScheduleEnabled, enabled);
}

QList<ScheduleRule> ConfigStore::scheduleRules() const
{
    return ConfigCodec::decodeRules(value(Keys::ScheduleRules, QStringLiteral("[]")).toString());
}

void ConfigStore::setScheduleRules(const QList<ScheduleRule>& rules)
{
    setValue(Keys::ScheduleRules, ConfigCodec::encodeRules(rules));
}

bool ConfigStore::addScheduleRule(const ScheduleRule& rule)
{
    QList<ScheduleRule> rules = scheduleRules();
    for (const auto& existing : rules) {
        if (existing.id == rule.id) {
            qWarning() << "[ConfigStore] 중복된 규칙 ID:" << rule.id;
            return false;
        }
    }
    rules.append(rule);
    setScheduleRules(rules);
    return true;
}

bool ConfigStore::updateScheduleRule(const ScheduleRule& rule)
{
    QList<ScheduleRule> rules = scheduleRules();
    for (auto& existing : rules) {
        if (existing.id == rule.id) {
            existing = rule;
            setScheduleRules(rules);
            return true;
        }
    }
    return false;
}

bool ConfigStore::removeScheduleRule(const QString& ruleId)
{
    QList<ScheduleRule> rules = scheduleRules();
    const auto removed = rules.removeIf([&](const ScheduleRule& r) { return r.id == ruleId; });
    if (removed == 0) return false;
    setScheduleRules(rules);
    return true;
}

int ConfigStore::scheduleTimezoneOffsetMinutes() const
{
    bool ok = false;
    const int minutes = value(Keys::ScheduleTimezoneOffset, 0).toInt(&ok);
    return ok ? minutes : 0;
}

void ConfigStore::setScheduleTimezoneOffsetMinutes(int minutes)
{
    setValue(Keys::ScheduleTimezoneOffset, minutes);
}

} // namespace Config
} // namespace Themis
