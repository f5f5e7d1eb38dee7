#pragma once

#include <QString>
#include <stdexcept>

namespace icalendar {
namespace model {

// Thrown by the typed accessors of Property when the raw value does not
// match the grammar of its value type. The raw text stays available.
class ConversionError : public std::runtime_error
{
public:
    ConversionError(QString propertyName, QString rawValue, QString reason);

    const QString &propertyName() const { return m_propertyName; }
    const QString &rawValue() const { return m_rawValue; }
    const QString &reason() const { return m_reason; }

private:
    QString m_propertyName;
    QString m_rawValue;
    QString m_reason;
};

} // namespace model
} // namespace icalendar
