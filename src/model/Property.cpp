#include "icalendar/model/Property.hpp"

#include "icalendar/core/Logging.hpp"
#include "icalendar/model/ValueParser.hpp"

namespace icalendar {
namespace model {

namespace {

bool nameIn(const QString &name, std::initializer_list<const char *> names)
{
    for (const char *candidate : names) {
        if (name == QLatin1String(candidate)) {
            return true;
        }
    }
    return false;
}

} // namespace

Property::Property(QString name, parser::Parameters parameters, QString rawValue, int lineNumber)
    : m_name(name.toUpper())
    , m_parameters(std::move(parameters))
    , m_rawValue(std::move(rawValue))
    , m_lineNumber(lineNumber)
{
}

const QString &Property::name() const
{
    return m_name;
}

const parser::Parameters &Property::parameters() const
{
    return m_parameters;
}

QString Property::parameter(const QString &name, const QString &defaultValue) const
{
    return m_parameters.value(name, defaultValue);
}

const QString &Property::rawValue() const
{
    return m_rawValue;
}

int Property::lineNumber() const
{
    return m_lineNumber;
}

ValueType Property::defaultValueType(const QString &propertyName)
{
    const QString name = propertyName.toUpper();
    if (nameIn(name, { "DTSTART", "DTEND", "DUE", "RECURRENCE-ID", "DTSTAMP", "CREATED", "LAST-MODIFIED",
                       "COMPLETED" })) {
        return ValueType::DateTime;
    }
    if (nameIn(name, { "RDATE", "EXDATE" })) {
        return ValueType::DateTimeList;
    }
    if (nameIn(name, { "DURATION", "TRIGGER" })) {
        return ValueType::Duration;
    }
    if (nameIn(name, { "RRULE", "EXRULE" })) {
        return ValueType::RecurrenceRule;
    }
    if (name == QLatin1String("FREEBUSY")) {
        return ValueType::PeriodList;
    }
    if (nameIn(name, { "CATEGORIES", "RESOURCES" })) {
        return ValueType::TextList;
    }
    if (name == QLatin1String("GEO")) {
        return ValueType::FloatList;
    }
    if (nameIn(name, { "PRIORITY", "SEQUENCE", "REPEAT", "PERCENT-COMPLETE" })) {
        return ValueType::Integer;
    }
    if (nameIn(name, { "TZOFFSETFROM", "TZOFFSETTO" })) {
        return ValueType::UtcOffset;
    }
    return ValueType::Text;
}

ValueType Property::valueType() const
{
    const ValueType base = defaultValueType(m_name);
    const QString value = m_parameters.value(QStringLiteral("VALUE")).toUpper();
    if (value.isEmpty()) {
        return base;
    }
    if (value == QLatin1String("DATE") || value == QLatin1String("DATE-TIME")) {
        return base == ValueType::DateTimeList ? ValueType::DateTimeList : ValueType::DateTime;
    }
    if (value == QLatin1String("PERIOD")) {
        return ValueType::PeriodList;
    }
    if (value == QLatin1String("DURATION")) {
        return ValueType::Duration;
    }
    if (value == QLatin1String("INTEGER")) {
        return ValueType::Integer;
    }
    if (value == QLatin1String("FLOAT")) {
        return ValueType::FloatList;
    }
    if (value == QLatin1String("BOOLEAN")) {
        return ValueType::Boolean;
    }
    if (value == QLatin1String("RECUR")) {
        return ValueType::RecurrenceRule;
    }
    if (value == QLatin1String("UTC-OFFSET")) {
        return ValueType::UtcOffset;
    }
    if (value == QLatin1String("TEXT") && base == ValueType::TextList) {
        return ValueType::TextList;
    }
    // TEXT, URI, CAL-ADDRESS, BINARY and extension types stay textual.
    return ValueType::Text;
}

void Property::fail(const QString &reason) const
{
    throw ConversionError(m_name, m_rawValue, reason);
}

PropertyValue Property::convert() const
{
    const QString tzid = m_parameters.value(QStringLiteral("TZID"));
    const bool dateOnly = m_parameters.value(QStringLiteral("VALUE")).compare(QLatin1String("DATE"), Qt::CaseInsensitive) == 0;
    const ValueType type = valueType();

    switch (type) {
    case ValueType::Text:
        return unescapeText(m_rawValue);
    case ValueType::TextList:
        return splitEscapedList(m_rawValue);
    case ValueType::Integer:
        if (const auto number = parseInteger(m_rawValue)) {
            return *number;
        }
        break;
    case ValueType::FloatList: {
        const QChar separator = m_name == QLatin1String("GEO") ? QLatin1Char(';') : QLatin1Char(',');
        if (const auto numbers = parseFloatList(m_rawValue, separator)) {
            return *numbers;
        }
        break;
    }
    case ValueType::Boolean:
        if (const auto flag = parseBoolean(m_rawValue)) {
            return *flag;
        }
        break;
    case ValueType::DateTime:
        if (const auto value = parseDateTime(m_rawValue, tzid, dateOnly)) {
            return *value;
        }
        break;
    case ValueType::DateTimeList:
        if (const auto values = parseDateTimeList(m_rawValue, tzid, dateOnly)) {
            return *values;
        }
        break;
    case ValueType::Duration:
        if (const auto value = parseDuration(m_rawValue)) {
            return *value;
        }
        break;
    case ValueType::PeriodList: {
        QList<Period> periods;
        const QStringList parts = m_rawValue.split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (const QString &part : parts) {
            const auto period = parsePeriod(part, tzid);
            if (!period) {
                fail(QStringLiteral("malformed period %1").arg(part));
            }
            periods << *period;
        }
        return periods;
    }
    case ValueType::RecurrenceRule: {
        QString error;
        const auto rule = recurrence::RecurrenceRule::fromString(m_rawValue, &error);
        if (!rule) {
            fail(error);
        }
        if (!rule->isValid()) {
            qCWarning(lcRecurrence) << m_name << "on line" << m_lineNumber << "is not a usable rule:"
                                    << rule->definitionError();
        }
        return *rule;
    }
    case ValueType::UtcOffset:
        if (const auto offset = parseUtcOffset(m_rawValue)) {
            return *offset;
        }
        break;
    }
    fail(QStringLiteral("not a valid %1").arg(valueTypeName(type)));
}

const PropertyValue &Property::typedValue() const
{
    if (m_value) {
        return *m_value;
    }
    if (m_error) {
        throw *m_error;
    }
    try {
        m_value = convert();
    } catch (const ConversionError &error) {
        qCDebug(lcModel) << "conversion failed:" << error.what();
        m_error = error;
        throw;
    }
    return *m_value;
}

bool Property::isConverted() const
{
    return m_value.has_value() || m_error.has_value();
}

template<typename T>
const T &Property::as(ValueType expected) const
{
    const PropertyValue &value = typedValue();
    if (const T *typed = std::get_if<T>(&value)) {
        return *typed;
    }
    fail(QStringLiteral("value is not a %1").arg(valueTypeName(expected)));
}

QString Property::text() const
{
    return as<QString>(ValueType::Text);
}

QStringList Property::textList() const
{
    return as<QStringList>(ValueType::TextList);
}

int Property::integer() const
{
    return as<int>(ValueType::Integer);
}

QList<double> Property::floats() const
{
    return as<QList<double>>(ValueType::FloatList);
}

DateTimeValue Property::dateTime() const
{
    return as<DateTimeValue>(ValueType::DateTime);
}

QList<DateTimeValue> Property::dateTimes() const
{
    const PropertyValue &value = typedValue();
    if (const auto *single = std::get_if<DateTimeValue>(&value)) {
        return { *single };
    }
    if (const auto *periods = std::get_if<QList<Period>>(&value)) {
        QList<DateTimeValue> starts;
        for (const Period &period : *periods) {
            starts << period.start;
        }
        return starts;
    }
    return as<QList<DateTimeValue>>(ValueType::DateTimeList);
}

Duration Property::duration() const
{
    return as<Duration>(ValueType::Duration);
}

QList<Period> Property::periods() const
{
    return as<QList<Period>>(ValueType::PeriodList);
}

const recurrence::RecurrenceRule &Property::recurrenceRule() const
{
    return as<recurrence::RecurrenceRule>(ValueType::RecurrenceRule);
}

UtcOffset Property::utcOffset() const
{
    return as<UtcOffset>(ValueType::UtcOffset);
}

} // namespace model
} // namespace icalendar
