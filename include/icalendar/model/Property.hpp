#pragma once

#include <QString>
#include <optional>

#include "icalendar/model/ConversionError.hpp"
#include "icalendar/model/PropertyValue.hpp"
#include "icalendar/parser/ContentLine.hpp"

namespace icalendar {
namespace model {

// One content line of a component. The raw value is kept as written and
// converted to its typed form on first access; the result (or the failure)
// is cached for the lifetime of the property. The cache is not locked, so a
// parse tree must stay with one thread of control.
class Property
{
public:
    Property(QString name, parser::Parameters parameters, QString rawValue, int lineNumber = 0);

    const QString &name() const;
    const parser::Parameters &parameters() const;
    QString parameter(const QString &name, const QString &defaultValue = QString()) const;
    const QString &rawValue() const;
    int lineNumber() const;

    // Type from the VALUE parameter, falling back to the property's default.
    ValueType valueType() const;
    static ValueType defaultValueType(const QString &propertyName);

    // Throws ConversionError when the raw value does not parse.
    const PropertyValue &typedValue() const;
    bool isConverted() const;

    // Typed shortcuts; they throw ConversionError when the value does not
    // parse or holds another type.
    QString text() const;
    QStringList textList() const;
    int integer() const;
    QList<double> floats() const;
    DateTimeValue dateTime() const;
    QList<DateTimeValue> dateTimes() const;
    Duration duration() const;
    QList<Period> periods() const;
    const recurrence::RecurrenceRule &recurrenceRule() const;
    UtcOffset utcOffset() const;

private:
    PropertyValue convert() const;
    [[noreturn]] void fail(const QString &reason) const;

    template<typename T>
    const T &as(ValueType expected) const;

    QString m_name;
    parser::Parameters m_parameters;
    QString m_rawValue;
    int m_lineNumber = 0;

    mutable std::optional<PropertyValue> m_value;
    mutable std::optional<ConversionError> m_error;
};

} // namespace model
} // namespace icalendar
