#include "icalendar/model/ConversionError.hpp"

namespace icalendar {
namespace model {

ConversionError::ConversionError(QString propertyName, QString rawValue, QString reason)
    : std::runtime_error(QStringLiteral("%1: %2 (%3)").arg(propertyName, reason, rawValue).toStdString())
    , m_propertyName(std::move(propertyName))
    , m_rawValue(std::move(rawValue))
    , m_reason(std::move(reason))
{
}

} // namespace model
} // namespace icalendar
