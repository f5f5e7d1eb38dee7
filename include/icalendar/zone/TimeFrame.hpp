#pragma once

#include <QDateTime>
#include <QString>

#include "icalendar/model/Values.hpp"

namespace icalendar {
namespace zone {

class ZoneResolver;

// The clock a recurring series is expanded in: floating local time, UTC or a
// named zone. Recurrence works on wall clocks of the frame; instants are
// what the timeline compares (UTC for resolvable frames, the wall clock
// itself for floating ones).
class TimeFrame
{
public:
    enum class Kind
    {
        Floating,
        Utc,
        Zoned,
    };

    TimeFrame() = default;

    static TimeFrame of(const model::DateTimeValue &value);
    static TimeFrame floating();
    static TimeFrame utc();
    static TimeFrame zoned(const QString &zoneId);

    Kind kind() const;
    const QString &zoneId() const;

    // True when the resolver knows this frame's zone (always for floating/UTC).
    bool isResolvable(const ZoneResolver *resolver, const QDateTime &sample) const;

    // Wall clock of value as seen from this frame. Floating values are read
    // as if they were written in this frame.
    QDateTime wallClockOf(const model::DateTimeValue &value, const ZoneResolver *resolver) const;

    QDateTime toInstant(const QDateTime &wallClock, const ZoneResolver *resolver) const;
    QDateTime fromInstant(const QDateTime &instant, const ZoneResolver *resolver) const;

    bool operator==(const TimeFrame &other) const;
    bool operator!=(const TimeFrame &other) const { return !(*this == other); }

private:
    Kind m_kind = Kind::Floating;
    QString m_zoneId;
};

} // namespace zone
} // namespace icalendar
