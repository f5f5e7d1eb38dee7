#pragma once

#include <QList>
#include <QString>
#include <Qt>
#include <optional>

#include "icalendar/model/Values.hpp"

namespace icalendar {
namespace recurrence {

enum class Frequency
{
    Secondly,
    Minutely,
    Hourly,
    Daily,
    Weekly,
    Monthly,
    Yearly,
};

QString frequencyName(Frequency frequency);

struct WeekdayNum
{
    int ordinal = 0; // 0: every such weekday, +n/-n: n-th from start/end
    Qt::DayOfWeek day = Qt::Monday;

    bool operator==(const WeekdayNum &other) const { return ordinal == other.ordinal && day == other.day; }
};

// A parsed RRULE/EXRULE value. A rule that parsed but is semantically
// inconsistent (COUNT with UNTIL, BYMONTH=13, ...) reports it through
// definitionError() and expands to nothing.
struct RecurrenceRule
{
    Frequency frequency = Frequency::Daily;
    int interval = 1;
    std::optional<int> count;
    std::optional<model::DateTimeValue> until;

    QList<int> bySecond;
    QList<int> byMinute;
    QList<int> byHour;
    QList<WeekdayNum> byDay;
    QList<int> byMonthDay;
    QList<int> byYearDay;
    QList<int> byWeekNo;
    QList<int> byMonth;
    QList<int> bySetPos;
    Qt::DayOfWeek weekStart = Qt::Monday;

    static std::optional<RecurrenceRule> fromString(const QString &text, QString *error = nullptr);

    QString definitionError() const;
    bool isValid() const;

    bool operator==(const RecurrenceRule &other) const;
    bool operator!=(const RecurrenceRule &other) const { return !(*this == other); }
};

} // namespace recurrence
} // namespace icalendar
