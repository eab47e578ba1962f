#include "config_codec.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace Themis {
namespace Config {

namespace {

// 파싱 실패 / 배열 아님 → 빈 배열
QJsonArray parseArray(const QString& payload, const char* what)
{
    if (payload.trimmed().isEmpty()) return {};

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(payload.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError) {
        qWarning() << "[ConfigCodec]" << what << "JSON 파싱 실패:" << err.errorString()
                   << "— 빈 목록으로 대체";
        return {};
    }
    if (!doc.isArray()) {
        qWarning() << "[ConfigCodec]" << what << "배열이 아님 — 빈 목록으로 대체";
        return {};
    }
    return doc.array();
}

QString toCompactJson(const QJsonArray& array)
{
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

} // namespace

// ============================================================
// 랜덤 풀
// ============================================================

QString ConfigCodec::encodePool(const QStringList& pool)
{
    return toCompactJson(QJsonArray::fromStringList(pool));
}

QStringList ConfigCodec::decodePool(const QString& payload)
{
    QStringList pool;
    const QJsonArray array = parseArray(payload, "randomPool");
    for (const QJsonValue& v : array) {
        if (v.isString()) pool.append(v.toString());
    }
    return pool;
}

// ============================================================
// 스케줄 규칙
// ============================================================

QString ConfigCodec::encodeRules(const QList<ScheduleRule>& rules)
{
    QJsonArray array;
    for (const auto& rule : rules) {
        array.append(ruleToJson(rule));
    }
    return toCompactJson(array);
}

QList<ScheduleRule> ConfigCodec::decodeRules(const QString& payload)
{
    QList<ScheduleRule> rules;
    const QJsonArray array = parseArray(payload, "scheduleRules");
    for (const QJsonValue& v : array) {
        if (!v.isObject()) continue;
        rules.append(ruleFromJson(v.toObject()));
    }
    return rules;
}

QJsonObject ConfigCodec::ruleToJson(const ScheduleRule& rule)
{
    QJsonArray days;
    for (int d : rule.days) days.append(d);

    QJsonObject obj;
    obj["id"] = rule.id;
    obj["name"] = rule.name;
    obj["themeId"] = rule.themeId;
    obj["days"] = days;
    obj["start"] = rule.start;
    obj["end"] = rule.end;
    return obj;
}

ScheduleRule ConfigCodec::ruleFromJson(const QJsonObject& obj)
{
    ScheduleRule rule;
    rule.id = obj.value("id").toString();
    rule.name = obj.value("name").toString();
    rule.themeId = obj.value("themeId").toString();

    QList<int> days;
    const QJsonArray dayArray = obj.value("days").toArray();
    for (const QJsonValue& d : dayArray) {
        if (d.isDouble()) days.append(d.toInt(-1));
    }
    rule.days = normalizeDays(days);

    // 누락된 시각은 하루 전체에 가깝게
    rule.start = obj.value("start").toString(QStringLiteral("00:00"));
    rule.end = obj.value("end").toString(QStringLiteral("23:59"));
    return rule;
}

QList<int> ConfigCodec::normalizeDays(const QList<int>& days)
{
    QList<int> result;
    for (int d : days) {
        if (d >= 0 && d <= 6 && !result.contains(d)) result.append(d);
    }
    return result;
}

} // namespace Config
} // namespace Themis
