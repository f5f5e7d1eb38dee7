#include "icalendar/model/Values.hpp"

#include <cstdlib>

namespace icalendar {
namespace model {

QString valueTypeName(ValueType type)
{
    switch (type) {
    case ValueType::Text:
        return QStringLiteral("TEXT");
    case ValueType::TextList:
        return QStringLiteral("TEXT-LIST");
    case ValueType::Integer:
        return QStringLiteral("INTEGER");
    case ValueType::FloatList:
        return QStringLiteral("FLOAT-LIST");
    case ValueType::Boolean:
        return QStringLiteral("BOOLEAN");
    case ValueType::DateTime:
        return QStringLiteral("DATE-TIME");
    case ValueType::DateTimeList:
        return QStringLiteral("DATE-TIME-LIST");
    case ValueType::Duration:
        return QStringLiteral("DURATION");
    case ValueType::PeriodList:
        return QStringLiteral("PERIOD-LIST");
    case ValueType::RecurrenceRule:
        return QStringLiteral("RECUR");
    case ValueType::UtcOffset:
        return QStringLiteral("UTC-OFFSET");
    }
    return QString();
}

bool DateTimeValue::isValid() const
{
    return date.isValid() && (dateOnly || time.isValid());
}

bool DateTimeValue::isFloating() const
{
    return !utc && tzid.isEmpty();
}

QDateTime DateTimeValue::wallClock() const
{
    return QDateTime(date, dateOnly ? QTime(0, 0) : time, Qt::UTC);
}

bool DateTimeValue::operator==(const DateTimeValue &other) const
{
    return date == other.date && dateOnly == other.dateOnly && utc == other.utc && tzid == other.tzid
        && (dateOnly || time == other.time);
}

bool Duration::isZero() const
{
    return totalSeconds() == 0;
}

qint64 Duration::totalSeconds() const
{
    const qint64 total = ((static_cast<qint64>(weeks) * 7 + days) * 24 + hours) * 3600
        + static_cast<qint64>(minutes) * 60 + seconds;
    return negative ? -total : total;
}

QDateTime Duration::addTo(const QDateTime &start) const
{
    const int sign = negative ? -1 : 1;
    const qint64 timePart = static_cast<qint64>(hours) * 3600 + static_cast<qint64>(minutes) * 60 + seconds;
    return start.addDays(sign * (static_cast<qint64>(weeks) * 7 + days)).addSecs(sign * timePart);
}

Duration Duration::fromSeconds(qint64 seconds)
{
    Duration duration;
    duration.negative = seconds < 0;
    qint64 remaining = std::llabs(seconds);
    duration.days = static_cast<int>(remaining / 86400);
    remaining %= 86400;
    duration.hours = static_cast<int>(remaining / 3600);
    remaining %= 3600;
    duration.minutes = static_cast<int>(remaining / 60);
    duration.seconds = static_cast<int>(remaining % 60);
    return duration;
}

bool Duration::operator==(const Duration &other) const
{
    return negative == other.negative && weeks == other.weeks && days == other.days && hours == other.hours
        && minutes == other.minutes && seconds == other.seconds;
}

bool Period::operator==(const Period &other) const
{
    return start == other.start && end == other.end && duration == other.duration;
}

} // namespace model
} // namespace icalendar
