#pragma once

#include <QString>

namespace icalendar {
namespace model {

enum class ComponentType
{
    Calendar,
    Event,
    Todo,
    Journal,
    FreeBusy,
    Timezone,
    TimezoneRule, // STANDARD or DAYLIGHT inside a VTIMEZONE
    Alarm,
    Unrecognized,
};

ComponentType componentTypeFromName(const QString &name);

// Canonical name for the type; Unrecognized has none.
QString componentTypeName(ComponentType type);

} // namespace model
} // namespace icalendar
