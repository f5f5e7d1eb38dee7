#pragma once

#include <QDate>
#include <QDateTime>
#include <QList>
#include <QString>
#include <QTime>
#include <optional>

namespace icalendar {
namespace model {

enum class ValueType
{
    Text,
    TextList,
    Integer,
    FloatList,
    Boolean,
    DateTime,
    DateTimeList,
    Duration,
    PeriodList,
    RecurrenceRule,
    UtcOffset,
};

QString valueTypeName(ValueType type);

// A DATE or DATE-TIME value as written: either floating, UTC ("Z") or bound
// to a TZID. Zone resolution happens later, in the timeline.
struct DateTimeValue
{
    QDate date;
    QTime time;
    bool dateOnly = false;
    bool utc = false;
    QString tzid;

    bool isValid() const;
    bool isFloating() const;

    // The value's date and time with no zone applied. Stored with Qt::UTC so
    // arithmetic on it never goes through the system zone.
    QDateTime wallClock() const;

    bool operator==(const DateTimeValue &other) const;
    bool operator!=(const DateTimeValue &other) const { return !(*this == other); }
};

struct Duration
{
    bool negative = false;
    int weeks = 0;
    int days = 0;
    int hours = 0;
    int minutes = 0;
    int seconds = 0;

    bool isZero() const;
    qint64 totalSeconds() const;

    // Weeks and days are nominal (calendar days), the time part is exact.
    QDateTime addTo(const QDateTime &start) const;

    static Duration fromSeconds(qint64 seconds);

    bool operator==(const Duration &other) const;
    bool operator!=(const Duration &other) const { return !(*this == other); }
};

struct Period
{
    DateTimeValue start;
    DateTimeValue end; // invalid when the period is given as start/duration
    std::optional<Duration> duration;

    bool operator==(const Period &other) const;
};

struct UtcOffset
{
    int seconds = 0;

    bool operator==(const UtcOffset &other) const { return seconds == other.seconds; }
};

} // namespace model
} // namespace icalendar
