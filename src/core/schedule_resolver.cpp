#include "schedule_resolver.h"
#include "time_range.h"

#include <QRandomGenerator>

namespace Themis {
namespace Core {

std::optional<QString> ScheduleResolver::resolve(const QList<ScheduleRule>& rules,
                                                 const QDateTime& instant,
                                                 int tzOffsetMinutes)
{
    if (rules.isEmpty() || !instant.isValid()) return std::nullopt;

    const QDateTime adjusted = adjustInstant(instant, tzOffsetMinutes);
    for (const auto& rule : rules) {
        if (matches(rule, adjusted)) {
            return rule.themeId;
        }
    }
    return std::nullopt;
}

int ScheduleResolver::dayOfWeek(const QDateTime& adjusted)
{
    // Qt: 월요일 1 ~ 일요일 7
    return adjusted.date().dayOfWeek() % 7;
}

QDateTime ScheduleResolver::adjustInstant(const QDateTime& instant, int tzOffsetMinutes)
{
    if (tzOffsetMinutes == 0) return instant;
    return instant.addSecs(static_cast<qint64>(tzOffsetMinutes) * 60);
}

bool ScheduleResolver::matches(const ScheduleRule& rule, const QDateTime& adjusted)
{
    if (rule.themeId.isEmpty()) return false;
    if (!rule.days.contains(dayOfWeek(adjusted))) return false;
    return inRange(rule.start, rule.end, adjusted.time());
}

ScheduleRule ScheduleResolver::makeDefaultRule(const QList<ThemeDescriptor>& catalog,
                                               int existingCount,
                                               const QDateTime& now)
{
    ScheduleRule rule;
    rule.id = QStringLiteral("%1-%2")
                  .arg(now.toMSecsSinceEpoch())
                  .arg(QRandomGenerator::global()->generate());
    rule.name = QStringLiteral("Rule %1").arg(existingCount + 1);
    rule.themeId = catalog.isEmpty() ? QString() : catalog.first().id;
    rule.days = { dayOfWeek(now) };
    rule.start = QStringLiteral("08:00");
    rule.end = QStringLiteral("17:00");
    return rule;
}

} // namespace Core
} // namespace Themis
