#include "icalendar/core/Settings.hpp"

#include <QSettings>
#include <QtGlobal>

namespace icalendar {
namespace core {

namespace {
const QString FloatingZoneKey = QStringLiteral("timeline/floatingZone");
const QString WindowDaysKey = QStringLiteral("timeline/windowDays");
const QString MaxOccurrencesKey = QStringLiteral("timeline/maxOccurrences");

constexpr int MaxWindowDays = 366 * 100;
} // namespace

TimelineSettings TimelineSettings::load(const QSettings &settings)
{
    TimelineSettings result;
    const QString zone = settings.value(FloatingZoneKey).toString().trimmed();
    if (!zone.isEmpty()) {
        result.floatingZone = zone;
    }

    bool ok = false;
    const int days = settings.value(WindowDaysKey, result.windowDays).toInt(&ok);
    if (ok) {
        result.windowDays = qBound(1, days, MaxWindowDays);
    }
    const int limit = settings.value(MaxOccurrencesKey, result.maxOccurrences).toInt(&ok);
    if (ok && limit > 0) {
        result.maxOccurrences = limit;
    }
    return result;
}

void TimelineSettings::save(QSettings &settings) const
{
    if (floatingZone) {
        settings.setValue(FloatingZoneKey, *floatingZone);
    } else {
        settings.remove(FloatingZoneKey);
    }
    settings.setValue(WindowDaysKey, windowDays);
    settings.setValue(MaxOccurrencesKey, maxOccurrences);
}

timeline::TimelineOptions TimelineSettings::toOptions() const
{
    timeline::TimelineOptions options;
    options.floatingZone = floatingZone;
    options.maxOccurrences = maxOccurrences;
    return options;
}

} // namespace core
} // namespace icalendar
