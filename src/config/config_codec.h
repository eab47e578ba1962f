/**
 * @file config_codec.h
 * @brief 설정 저장용 직렬화 — 랜덤 풀 / 스케줄 규칙 ↔ JSON 문자열
 *
 * 손상되었거나 형식이 맞지 않는 문자열은 빈 컬렉션으로 복구하며
 * 오류를 호출자에게 전달하지 않음.
 */

#pragma once

#include "core/theme_types.h"

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace Themis {
namespace Config {

class ConfigCodec {
public:
    /// 풀 → JSON 배열 문자열 (예: ["dark","light"])
    static QString encodePool(const QStringList& pool);

    /// JSON 배열 문자열 → 풀. 문자열이 아닌 항목은 건너뜀
    static QStringList decodePool(const QString& payload);

    /// 규칙 목록 → JSON 배열 문자열
    static QString encodeRules(const QList<ScheduleRule>& rules);

    /// JSON 배열 문자열 → 규칙 목록. 객체가 아닌 항목은 건너뜀
    static QList<ScheduleRule> decodeRules(const QString& payload);

    static QJsonObject ruleToJson(const ScheduleRule& rule);
    static ScheduleRule ruleFromJson(const QJsonObject& obj);

    /// 0~6 범위만 남기고 중복 제거 (저장된 순서 유지)
    static QList<int> normalizeDays(const QList<int>& days);
};

} // namespace Config
} // namespace Themis
