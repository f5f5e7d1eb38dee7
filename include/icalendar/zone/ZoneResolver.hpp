#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <optional>

namespace icalendar {
namespace zone {

// Answers "what is the UTC offset of zone X at wall-clock time T". Callers
// pass wall-clock QDateTimes (Qt::UTC spec, no zone applied).
class ZoneResolver
{
public:
    virtual ~ZoneResolver() = default;

    virtual std::optional<int> utcOffset(const QString &zoneId, const QDateTime &wallClock) const = 0;
};

// Backed by the zone database Qt was built with. Accepts IANA ids, Windows
// zone names and ids carrying a vendor path prefix ("/example.org/.../Europe/Vienna").
class SystemZoneResolver : public ZoneResolver
{
public:
    std::optional<int> utcOffset(const QString &zoneId, const QDateTime &wallClock) const override;
};

// Constant offsets per zone id, for hosts without a zone database.
class FixedOffsetZoneResolver : public ZoneResolver
{
public:
    void setOffset(const QString &zoneId, int offsetSeconds);

    std::optional<int> utcOffset(const QString &zoneId, const QDateTime &wallClock) const override;

private:
    QHash<QString, int> m_offsets;
};

} // namespace zone
} // namespace icalendar
