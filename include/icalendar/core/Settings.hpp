#pragma once

#include <QString>
#include <optional>

#include "icalendar/timeline/Timeline.hpp"

class QSettings;

namespace icalendar {
namespace core {

// Persistent defaults of the timeline tool, kept under the "timeline" group.
struct TimelineSettings
{
    static constexpr int DefaultWindowDays = 30;

    std::optional<QString> floatingZone;
    int windowDays = DefaultWindowDays;
    int maxOccurrences = timeline::TimelineOptions().maxOccurrences;

    static TimelineSettings load(const QSettings &settings);
    void save(QSettings &settings) const;

    timeline::TimelineOptions toOptions() const;
};

} // namespace core
} // namespace icalendar
