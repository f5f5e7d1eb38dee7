#include "icalendar/model/ComponentType.hpp"

namespace icalendar {
namespace model {

ComponentType componentTypeFromName(const QString &name)
{
    const QString normalized = name.trimmed().toUpper();
    if (normalized == QLatin1String("VCALENDAR")) {
        return ComponentType::Calendar;
    }
    if (normalized == QLatin1String("VEVENT")) {
        return ComponentType::Event;
    }
    if (normalized == QLatin1String("VTODO")) {
        return ComponentType::Todo;
    }
    if (normalized == QLatin1String("VJOURNAL")) {
        return ComponentType::Journal;
    }
    if (normalized == QLatin1String("VFREEBUSY")) {
        return ComponentType::FreeBusy;
    }
    if (normalized == QLatin1String("VTIMEZONE")) {
        return ComponentType::Timezone;
    }
    if (normalized == QLatin1String("STANDARD") || normalized == QLatin1String("DAYLIGHT")) {
        return ComponentType::TimezoneRule;
    }
    if (normalized == QLatin1String("VALARM")) {
        return ComponentType::Alarm;
    }
    return ComponentType::Unrecognized;
}

QString componentTypeName(ComponentType type)
{
    switch (type) {
    case ComponentType::Calendar:
        return QStringLiteral("VCALENDAR");
    case ComponentType::Event:
        return QStringLiteral("VEVENT");
    case ComponentType::Todo:
        return QStringLiteral("VTODO");
    case ComponentType::Journal:
        return QStringLiteral("VJOURNAL");
    case ComponentType::FreeBusy:
        return QStringLiteral("VFREEBUSY");
    case ComponentType::Timezone:
        return QStringLiteral("VTIMEZONE");
    case ComponentType::TimezoneRule:
        return QStringLiteral("STANDARD");
    case ComponentType::Alarm:
        return QStringLiteral("VALARM");
    case ComponentType::Unrecognized:
        break;
    }
    return QString();
}

} // namespace model
} // namespace icalendar
