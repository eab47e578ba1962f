#include "time_range.h"

#include <QStringList>

namespace Themis {
namespace Core {

namespace {

// 빈 조각은 0, 숫자가 아니면 실패
bool parseComponent(const QString& part, int* out)
{
    const QString trimmed = part.trimmed();
    if (trimmed.isEmpty()) {
        *out = 0;
        return true;
    }
    bool ok = false;
    *out = trimmed.toInt(&ok);
    return ok;
}

} // namespace

int minutesFromTimeString(const QString& text)
{
    const QStringList parts = text.split(QLatin1Char(':'));
    if (parts.size() < 2) return 0;

    int hours = 0;
    int minutes = 0;
    if (!parseComponent(parts.at(0), &hours) || !parseComponent(parts.at(1), &minutes)) {
        return 0;
    }
    return hours * 60 + minutes;
}

int minutesOfDay(const QTime& time)
{
    if (!time.isValid()) return 0;
    return time.hour() * 60 + time.minute();
}

bool inRange(int startMinutes, int endMinutes, int instantMinutes)
{
    if (startMinutes == endMinutes) return true;

    if (startMinutes < endMinutes) {
        return instantMinutes >= startMinutes && instantMinutes < endMinutes;
    }

    // 자정 넘김 구간 (예: 22:00 ~ 06:00)
    return instantMinutes >= startMinutes || instantMinutes < endMinutes;
}

bool inRange(const QString& start, const QString& end, const QTime& instant)
{
    return inRange(minutesFromTimeString(start),
                   minutesFromTimeString(end),
                   minutesOfDay(instant));
}

} // namespace Core
} // namespace Themis
