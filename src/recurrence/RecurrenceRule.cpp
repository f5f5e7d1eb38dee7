#include "icalendar/recurrence/RecurrenceRule.hpp"

#include "icalendar/core/Logging.hpp"
#include "icalendar/model/ValueParser.hpp"

namespace icalendar {
namespace recurrence {

namespace {

std::optional<Frequency> frequencyFromString(const QString &value)
{
    if (value == QLatin1String("SECONDLY")) {
        return Frequency::Secondly;
    }
    if (value == QLatin1String("MINUTELY")) {
        return Frequency::Minutely;
    }
    if (value == QLatin1String("HOURLY")) {
        return Frequency::Hourly;
    }
    if (value == QLatin1String("DAILY")) {
        return Frequency::Daily;
    }
    if (value == QLatin1String("WEEKLY")) {
        return Frequency::Weekly;
    }
    if (value == QLatin1String("MONTHLY")) {
        return Frequency::Monthly;
    }
    if (value == QLatin1String("YEARLY")) {
        return Frequency::Yearly;
    }
    return std::nullopt;
}

std::optional<Qt::DayOfWeek> weekdayFromString(const QString &value)
{
    static const char *const Names[] = { "MO", "TU", "WE", "TH", "FR", "SA", "SU" };
    for (int i = 0; i < 7; ++i) {
        if (value == QLatin1String(Names[i])) {
            return static_cast<Qt::DayOfWeek>(i + 1);
        }
    }
    return std::nullopt;
}

std::optional<WeekdayNum> weekdayNumFromString(const QString &value)
{
    if (value.size() < 2) {
        return std::nullopt;
    }
    const auto day = weekdayFromString(value.right(2));
    if (!day) {
        return std::nullopt;
    }
    WeekdayNum result;
    result.day = *day;
    const QString ordinal = value.left(value.size() - 2);
    if (!ordinal.isEmpty()) {
        bool ok = false;
        result.ordinal = ordinal.toInt(&ok);
        if (!ok || result.ordinal == 0) {
            return std::nullopt;
        }
    }
    return result;
}

bool fail(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
    return false;
}

bool inRange(const QList<int> &values, int low, int high, bool allowNegative)
{
    for (int value : values) {
        const int magnitude = allowNegative ? qAbs(value) : value;
        if (value == 0 && low > 0) {
            return false;
        }
        if (!allowNegative && value < 0) {
            return false;
        }
        if (magnitude < low || magnitude > high) {
            return false;
        }
    }
    return true;
}

} // namespace

QString frequencyName(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Secondly:
        return QStringLiteral("SECONDLY");
    case Frequency::Minutely:
        return QStringLiteral("MINUTELY");
    case Frequency::Hourly:
        return QStringLiteral("HOURLY");
    case Frequency::Daily:
        return QStringLiteral("DAILY");
    case Frequency::Weekly:
        return QStringLiteral("WEEKLY");
    case Frequency::Monthly:
        return QStringLiteral("MONTHLY");
    case Frequency::Yearly:
        return QStringLiteral("YEARLY");
    }
    return QString();
}

std::optional<RecurrenceRule> RecurrenceRule::fromString(const QString &text, QString *error)
{
    RecurrenceRule rule;
    bool hasFrequency = false;

    auto parseList = [error](const QString &key, const QString &value, QList<int> *target) {
        const auto numbers = model::parseIntegerList(value);
        if (!numbers) {
            return fail(error, QStringLiteral("%1 is not a list of integers: %2").arg(key, value));
        }
        *target = *numbers;
        return true;
    };

    const QStringList parts = text.trimmed().split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int equals = part.indexOf(QLatin1Char('='));
        if (equals <= 0) {
            fail(error, QStringLiteral("rule part without '=': %1").arg(part));
            return std::nullopt;
        }
        const QString key = part.left(equals).trimmed().toUpper();
        const QString value = part.mid(equals + 1).trimmed().toUpper();

        bool ok = true;
        if (key == QLatin1String("FREQ")) {
            const auto frequency = frequencyFromString(value);
            if (!frequency) {
                ok = fail(error, QStringLiteral("unknown FREQ %1").arg(value));
            } else {
                rule.frequency = *frequency;
                hasFrequency = true;
            }
        } else if (key == QLatin1String("INTERVAL")) {
            const auto interval = model::parseInteger(value);
            if (interval) {
                rule.interval = *interval;
            } else {
                ok = fail(error, QStringLiteral("bad INTERVAL %1").arg(value));
            }
        } else if (key == QLatin1String("COUNT")) {
            const auto count = model::parseInteger(value);
            if (count) {
                rule.count = *count;
            } else {
                ok = fail(error, QStringLiteral("bad COUNT %1").arg(value));
            }
        } else if (key == QLatin1String("UNTIL")) {
            const auto until = model::parseDateTime(value);
            if (until) {
                rule.until = *until;
            } else {
                ok = fail(error, QStringLiteral("bad UNTIL %1").arg(value));
            }
        } else if (key == QLatin1String("BYSECOND")) {
            ok = parseList(key, value, &rule.bySecond);
        } else if (key == QLatin1String("BYMINUTE")) {
            ok = parseList(key, value, &rule.byMinute);
        } else if (key == QLatin1String("BYHOUR")) {
            ok = parseList(key, value, &rule.byHour);
        } else if (key == QLatin1String("BYMONTHDAY")) {
            ok = parseList(key, value, &rule.byMonthDay);
        } else if (key == QLatin1String("BYYEARDAY")) {
            ok = parseList(key, value, &rule.byYearDay);
        } else if (key == QLatin1String("BYWEEKNO")) {
            ok = parseList(key, value, &rule.byWeekNo);
        } else if (key == QLatin1String("BYMONTH")) {
            ok = parseList(key, value, &rule.byMonth);
        } else if (key == QLatin1String("BYSETPOS")) {
            ok = parseList(key, value, &rule.bySetPos);
        } else if (key == QLatin1String("BYDAY")) {
            rule.byDay.clear();
            const QStringList days = value.split(QLatin1Char(','));
            for (const QString &day : days) {
                const auto weekday = weekdayNumFromString(day.trimmed());
                if (!weekday) {
                    ok = fail(error, QStringLiteral("bad BYDAY entry %1").arg(day));
                    break;
                }
                rule.byDay << *weekday;
            }
        } else if (key == QLatin1String("WKST")) {
            const auto weekday = weekdayFromString(value);
            if (weekday) {
                rule.weekStart = *weekday;
            } else {
                ok = fail(error, QStringLiteral("bad WKST %1").arg(value));
            }
        } else {
            qCDebug(lcRecurrence) << "ignoring unknown rule part" << key;
        }
        if (!ok) {
            return std::nullopt;
        }
    }

    if (!hasFrequency) {
        fail(error, QStringLiteral("rule has no FREQ"));
        return std::nullopt;
    }
    return rule;
}

QString RecurrenceRule::definitionError() const
{
    if (count && until) {
        return QStringLiteral("COUNT and UNTIL are mutually exclusive");
    }
    if (interval < 1) {
        return QStringLiteral("INTERVAL must be positive");
    }
    if (count && *count < 1) {
        return QStringLiteral("COUNT must be positive");
    }
    if (!inRange(bySecond, 0, 60, false)) {
        return QStringLiteral("BYSECOND out of range");
    }
    if (!inRange(byMinute, 0, 59, false)) {
        return QStringLiteral("BYMINUTE out of range");
    }
    if (!inRange(byHour, 0, 23, false)) {
        return QStringLiteral("BYHOUR out of range");
    }
    if (!inRange(byMonthDay, 1, 31, true)) {
        return QStringLiteral("BYMONTHDAY out of range");
    }
    if (!inRange(byYearDay, 1, 366, true)) {
        return QStringLiteral("BYYEARDAY out of range");
    }
    if (!inRange(byWeekNo, 1, 53, true)) {
        return QStringLiteral("BYWEEKNO out of range");
    }
    if (!inRange(byMonth, 1, 12, false)) {
        return QStringLiteral("BYMONTH out of range");
    }
    if (!inRange(bySetPos, 1, 366, true)) {
        return QStringLiteral("BYSETPOS out of range");
    }
    for (const WeekdayNum &day : byDay) {
        if (qAbs(day.ordinal) > 53) {
            return QStringLiteral("BYDAY ordinal out of range");
        }
    }
    if (!byWeekNo.isEmpty() && frequency != Frequency::Yearly) {
        return QStringLiteral("BYWEEKNO is only valid with FREQ=YEARLY");
    }
    if (!byYearDay.isEmpty()
        && (frequency == Frequency::Daily || frequency == Frequency::Weekly || frequency == Frequency::Monthly)) {
        return QStringLiteral("BYYEARDAY is not valid with FREQ=%1").arg(frequencyName(frequency));
    }
    if (!byMonthDay.isEmpty() && frequency == Frequency::Weekly) {
        return QStringLiteral("BYMONTHDAY is not valid with FREQ=WEEKLY");
    }
    return QString();
}

bool RecurrenceRule::isValid() const
{
    return definitionError().isEmpty();
}

bool RecurrenceRule::operator==(const RecurrenceRule &other) const
{
    return frequency == other.frequency && interval == other.interval && count == other.count
        && until == other.until && bySecond == other.bySecond && byMinute == other.byMinute
        && byHour == other.byHour && byDay == other.byDay && byMonthDay == other.byMonthDay
        && byYearDay == other.byYearDay && byWeekNo == other.byWeekNo && byMonth == other.byMonth
        && bySetPos == other.bySetPos && weekStart == other.weekStart;
}

} // namespace recurrence
} // namespace icalendar
