#include "icalendar/zone/TimeFrame.hpp"

#include "icalendar/zone/ZoneResolver.hpp"

namespace icalendar {
namespace zone {

TimeFrame TimeFrame::of(const model::DateTimeValue &value)
{
    if (value.utc) {
        return utc();
    }
    if (!value.tzid.isEmpty()) {
        return zoned(value.tzid);
    }
    return floating();
}

TimeFrame TimeFrame::floating()
{
    return TimeFrame();
}

TimeFrame TimeFrame::utc()
{
    TimeFrame frame;
    frame.m_kind = Kind::Utc;
    return frame;
}

TimeFrame TimeFrame::zoned(const QString &zoneId)
{
    TimeFrame frame;
    frame.m_kind = Kind::Zoned;
    frame.m_zoneId = zoneId;
    return frame;
}

TimeFrame::Kind TimeFrame::kind() const
{
    return m_kind;
}

const QString &TimeFrame::zoneId() const
{
    return m_zoneId;
}

bool TimeFrame::isResolvable(const ZoneResolver *resolver, const QDateTime &sample) const
{
    if (m_kind != Kind::Zoned) {
        return true;
    }
    return resolver && resolver->utcOffset(m_zoneId, sample).has_value();
}

QDateTime TimeFrame::wallClockOf(const model::DateTimeValue &value, const ZoneResolver *resolver) const
{
    const TimeFrame source = of(value);
    if (source == *this || source.kind() == Kind::Floating || value.dateOnly) {
        return value.wallClock();
    }
    return fromInstant(source.toInstant(value.wallClock(), resolver), resolver);
}

QDateTime TimeFrame::toInstant(const QDateTime &wallClock, const ZoneResolver *resolver) const
{
    if (m_kind != Kind::Zoned || !resolver) {
        return wallClock;
    }
    const auto offset = resolver->utcOffset(m_zoneId, wallClock);
    return offset ? wallClock.addSecs(-*offset) : wallClock;
}

QDateTime TimeFrame::fromInstant(const QDateTime &instant, const ZoneResolver *resolver) const
{
    if (m_kind != Kind::Zoned || !resolver) {
        return instant;
    }
    // The offset depends on the wall clock we are looking for; a second
    // lookup settles it except inside a transition.
    const auto first = resolver->utcOffset(m_zoneId, instant);
    if (!first) {
        return instant;
    }
    const auto second = resolver->utcOffset(m_zoneId, instant.addSecs(*first));
    return instant.addSecs(second ? *second : *first);
}

bool TimeFrame::operator==(const TimeFrame &other) const
{
    return m_kind == other.m_kind && m_zoneId == other.m_zoneId;
}

} // namespace zone
} // namespace icalendar
