#include "theme_types.h"

namespace Themis {

const char* const kDayNames[7] = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
};

QString activeSourceName(ActiveSource source)
{
    switch (source) {
    case ActiveSource::Manual: return QStringLiteral("manual");
    case ActiveSource::Random: return QStringLiteral("random");
    case ActiveSource::Schedule: return QStringLiteral("schedule");
    }
    return QStringLiteral("manual");
}

QString dayName(int day)
{
    if (day < 0 || day > 6) return QString();
    return QString::fromLatin1(kDayNames[day]);
}

} // namespace Themis
