#pragma once

#include <QDateTime>
#include <memory>

namespace icalendar {
namespace model {
class Component;
}

namespace timeline {

// One dated instance of a component. start and end are instants: UTC for
// series with a resolvable frame, the plain wall clock for floating ones.
struct Occurrence
{
    std::shared_ptr<const model::Component> component; // the override when overridden
    std::shared_ptr<const model::Component> master;
    QDateTime start;
    QDateTime end;
    QDateTime recurrenceId; // wall clock of the series frame
    bool overridden = false;
    bool allDay = false;

    qint64 durationSeconds() const { return start.secsTo(end); }
};

} // namespace timeline
} // namespace icalendar
