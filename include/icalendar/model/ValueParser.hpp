#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

#include "icalendar/model/Values.hpp"

namespace icalendar {
namespace model {

// Grammar-level parsers for individual value types. They return std::nullopt
// on malformed input; Property turns that into a ConversionError.

std::optional<QDate> parseDate(const QString &value);

// DATE (8 characters) or DATE-TIME ("YYYYMMDDTHHMMSS[Z]"). A TZID is attached
// to non-UTC date-times only. With dateOnly set, a date-time value is rejected.
std::optional<DateTimeValue> parseDateTime(const QString &value, const QString &tzid = QString(), bool dateOnly = false);

std::optional<QList<DateTimeValue>> parseDateTimeList(const QString &value, const QString &tzid = QString(), bool dateOnly = false);

std::optional<Duration> parseDuration(const QString &value);

// "start/end" or "start/duration".
std::optional<Period> parsePeriod(const QString &value, const QString &tzid = QString());

std::optional<UtcOffset> parseUtcOffset(const QString &value);

std::optional<int> parseInteger(const QString &value);
std::optional<QList<int>> parseIntegerList(const QString &value);
std::optional<QList<double>> parseFloatList(const QString &value, QChar separator = QLatin1Char(','));
std::optional<bool> parseBoolean(const QString &value);

// Splits on separators that are not backslash-escaped and unescapes each part.
QStringList splitEscapedList(const QString &value, QChar separator = QLatin1Char(','));
QString unescapeText(const QString &value);

} // namespace model
} // namespace icalendar
