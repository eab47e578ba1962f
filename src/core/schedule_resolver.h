#pragma once

#include "core/theme_types.h"

#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

namespace Themis {
namespace Core {

// ============================================================
// ScheduleResolver — 요일/시간 규칙 중 첫 번째 일치 규칙 선택
// ============================================================
class ScheduleResolver {
public:
    // 규칙은 저장 순서대로 검사하며 첫 일치가 우선 (뒤의 겹치는 규칙은 도달 불가)
    static std::optional<QString> resolve(const QList<ScheduleRule>& rules,
                                          const QDateTime& instant,
                                          int tzOffsetMinutes);

    // 오프셋 적용 후 요일 (0 = 일요일)
    static int dayOfWeek(const QDateTime& adjusted);

    // tzOffsetMinutes == 0 이면 로컬 시간 그대로
    static QDateTime adjustInstant(const QDateTime& instant, int tzOffsetMinutes);

    static bool matches(const ScheduleRule& rule, const QDateTime& adjusted);

    // 편집기에서 새 규칙을 추가할 때의 기본값
    static ScheduleRule makeDefaultRule(const QList<ThemeDescriptor>& catalog,
                                        int existingCount,
                                        const QDateTime& now);
};

} // namespace Core
} // namespace Themis
