#include "icalendar/model/ValueParser.hpp"

namespace icalendar {
namespace model {

namespace {

bool allDigits(const QString &value, int from, int count)
{
    if (from + count > value.size()) {
        return false;
    }
    for (int i = from; i < from + count; ++i) {
        if (!value.at(i).isDigit()) {
            return false;
        }
    }
    return true;
}

int digitsAt(const QString &value, int from, int count)
{
    return value.mid(from, count).toInt();
}

} // namespace

std::optional<QDate> parseDate(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.size() != 8 || !allDigits(trimmed, 0, 8)) {
        return std::nullopt;
    }
    const QDate date(digitsAt(trimmed, 0, 4), digitsAt(trimmed, 4, 2), digitsAt(trimmed, 6, 2));
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

std::optional<DateTimeValue> parseDateTime(const QString &value, const QString &tzid, bool dateOnly)
{
    const QString trimmed = value.trimmed();
    DateTimeValue result;
    const auto date = parseDate(trimmed.left(8));
    if (!date) {
        return std::nullopt;
    }
    result.date = *date;

    if (trimmed.size() == 8) {
        result.dateOnly = true;
        return result;
    }
    if (dateOnly) {
        return std::nullopt;
    }
    if (trimmed.size() < 15 || trimmed.size() > 16 || trimmed.at(8).toUpper() != QLatin1Char('T')
        || !allDigits(trimmed, 9, 6)) {
        return std::nullopt;
    }
    if (trimmed.size() == 16) {
        if (trimmed.at(15).toUpper() != QLatin1Char('Z')) {
            return std::nullopt;
        }
        result.utc = true;
    }

    const int hour = digitsAt(trimmed, 9, 2);
    const int minute = digitsAt(trimmed, 11, 2);
    // Leap seconds are folded into the preceding second.
    const int second = qMin(digitsAt(trimmed, 13, 2), 59);
    result.time = QTime(hour, minute, second);
    if (!result.time.isValid()) {
        return std::nullopt;
    }
    if (!result.utc) {
        result.tzid = tzid;
    }
    return result;
}

std::optional<QList<DateTimeValue>> parseDateTimeList(const QString &value, const QString &tzid, bool dateOnly)
{
    QList<DateTimeValue> result;
    const QStringList parts = value.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const auto parsed = parseDateTime(part, tzid, dateOnly);
        if (!parsed) {
            return std::nullopt;
        }
        result << *parsed;
    }
    return result;
}

std::optional<Duration> parseDuration(const QString &value)
{
    const QString text = value.trimmed().toUpper();
    Duration duration;
    int i = 0;
    if (i < text.size() && (text.at(i) == QLatin1Char('+') || text.at(i) == QLatin1Char('-'))) {
        duration.negative = text.at(i) == QLatin1Char('-');
        ++i;
    }
    if (i >= text.size() || text.at(i) != QLatin1Char('P')) {
        return std::nullopt;
    }
    ++i;

    bool inTime = false;
    bool sawComponent = false;
    bool sawTimeComponent = false;
    QString seen;
    while (i < text.size()) {
        if (text.at(i) == QLatin1Char('T')) {
            if (inTime) {
                return std::nullopt;
            }
            inTime = true;
            ++i;
            continue;
        }
        const int numberStart = i;
        while (i < text.size() && text.at(i).isDigit()) {
            ++i;
        }
        if (i == numberStart || i >= text.size()) {
            return std::nullopt;
        }
        bool ok = false;
        const int number = text.mid(numberStart, i - numberStart).toInt(&ok);
        if (!ok) {
            return std::nullopt;
        }
        const QChar designator = text.at(i++);
        const QString key = inTime ? QStringLiteral("T") + designator : QString(designator);
        if (seen.contains(key)) {
            return std::nullopt;
        }
        seen += key;

        if (!inTime && designator == QLatin1Char('W')) {
            duration.weeks = number;
        } else if (!inTime && designator == QLatin1Char('D')) {
            duration.days = number;
        } else if (inTime && designator == QLatin1Char('H')) {
            duration.hours = number;
        } else if (inTime && designator == QLatin1Char('M')) {
            duration.minutes = number;
        } else if (inTime && designator == QLatin1Char('S')) {
            duration.seconds = number;
        } else {
            return std::nullopt;
        }
        sawComponent = true;
        sawTimeComponent = sawTimeComponent || inTime;
    }
    if (!sawComponent || (inTime && !sawTimeComponent)) {
        return std::nullopt;
    }
    return duration;
}

std::optional<Period> parsePeriod(const QString &value, const QString &tzid)
{
    const int slash = value.indexOf(QLatin1Char('/'));
    if (slash < 0) {
        return std::nullopt;
    }
    const auto start = parseDateTime(value.left(slash), tzid);
    if (!start || start->dateOnly) {
        return std::nullopt;
    }
    Period period;
    period.start = *start;

    const QString tail = value.mid(slash + 1).trimmed();
    if (tail.startsWith(QLatin1Char('P'), Qt::CaseInsensitive) || tail.startsWith(QLatin1Char('+'))
        || tail.startsWith(QLatin1Char('-'))) {
        period.duration = parseDuration(tail);
        if (!period.duration || period.duration->negative) {
            return std::nullopt;
        }
        return period;
    }
    const auto end = parseDateTime(tail, tzid);
    if (!end || end->dateOnly) {
        return std::nullopt;
    }
    period.end = *end;
    return period;
}

std::optional<UtcOffset> parseUtcOffset(const QString &value)
{
    const QString text = value.trimmed();
    if ((text.size() != 5 && text.size() != 7)
        || (text.at(0) != QLatin1Char('+') && text.at(0) != QLatin1Char('-'))
        || !allDigits(text, 1, text.size() - 1)) {
        return std::nullopt;
    }
    const int hours = digitsAt(text, 1, 2);
    const int minutes = digitsAt(text, 3, 2);
    const int seconds = text.size() == 7 ? digitsAt(text, 5, 2) : 0;
    if (hours > 23 || minutes > 59 || seconds > 59) {
        return std::nullopt;
    }
    UtcOffset offset;
    offset.seconds = hours * 3600 + minutes * 60 + seconds;
    if (text.at(0) == QLatin1Char('-')) {
        offset.seconds = -offset.seconds;
    }
    return offset;
}

std::optional<int> parseInteger(const QString &value)
{
    bool ok = false;
    const int number = value.trimmed().toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return number;
}

std::optional<QList<int>> parseIntegerList(const QString &value)
{
    QList<int> result;
    const QStringList parts = value.split(QLatin1Char(','));
    for (const QString &part : parts) {
        const auto number = parseInteger(part);
        if (!number) {
            return std::nullopt;
        }
        result << *number;
    }
    return result;
}

std::optional<QList<double>> parseFloatList(const QString &value, QChar separator)
{
    QList<double> result;
    const QStringList parts = value.split(separator);
    for (const QString &part : parts) {
        bool ok = false;
        const double number = part.trimmed().toDouble(&ok);
        if (!ok) {
            return std::nullopt;
        }
        result << number;
    }
    return result;
}

std::optional<bool> parseBoolean(const QString &value)
{
    const QString text = value.trimmed();
    if (text.compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0) {
        return true;
    }
    if (text.compare(QLatin1String("FALSE"), Qt::CaseInsensitive) == 0) {
        return false;
    }
    return std::nullopt;
}

QStringList splitEscapedList(const QString &value, QChar separator)
{
    QStringList parts;
    QString current;
    for (int i = 0; i < value.size(); ++i) {
        const QChar c = value.at(i);
        if (c == QLatin1Char('\\') && i + 1 < value.size()) {
            current += c;
            current += value.at(++i);
            continue;
        }
        if (c == separator) {
            parts << unescapeText(current);
            current.clear();
            continue;
        }
        current += c;
    }
    parts << unescapeText(current);
    return parts;
}

QString unescapeText(const QString &value)
{
    if (!value.contains(QLatin1Char('\\'))) {
        return value;
    }
    QString decoded;
    decoded.reserve(value.size());
    for (int i = 0; i < value.size(); ++i) {
        const QChar c = value.at(i);
        if (c != QLatin1Char('\\') || i + 1 >= value.size()) {
            decoded += c;
            continue;
        }
        const QChar escaped = value.at(++i);
        if (escaped == QLatin1Char('n') || escaped == QLatin1Char('N')) {
            decoded += QLatin1Char('\n');
        } else {
            decoded += escaped;
        }
    }
    return decoded;
}

} // namespace model
} // namespace icalendar
