#pragma once

#include <QString>
#include <QTime>

namespace Themis {
namespace Core {

// ============================================================
// TimeRange — 하루 중 시간 구간 판정 (자정 넘김 포함)
// ============================================================

// "HH:mm" → 자정 이후 분. 해석 불가능한 값은 0 (예외 없음)
int minutesFromTimeString(const QString& text);

int minutesOfDay(const QTime& time);

// start == end 이면 항상 true, start > end 이면 자정을 넘기는 구간
bool inRange(int startMinutes, int endMinutes, int instantMinutes);
bool inRange(const QString& start, const QString& end, const QTime& instant);

} // namespace Core
} // namespace Themis
