#include "icalendar/zone/ZoneResolver.hpp"

#include <QTimeZone>

namespace icalendar {
namespace zone {

namespace {

QTimeZone lookupZone(const QString &zoneId)
{
    const QString trimmed = zoneId.trimmed();
    QTimeZone zone(trimmed.toUtf8());
    if (zone.isValid()) {
        return zone;
    }
    const QByteArray iana = QTimeZone::windowsIdToDefaultIanaId(trimmed.toUtf8());
    if (!iana.isEmpty()) {
        zone = QTimeZone(iana);
        if (zone.isValid()) {
            return zone;
        }
    }
    // Vendor-prefixed ids end in the IANA name: try the last two, then the last path segment.
    const QStringList segments = trimmed.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    if (segments.size() >= 2) {
        zone = QTimeZone(segments.mid(segments.size() - 2).join(QLatin1Char('/')).toUtf8());
        if (zone.isValid()) {
            return zone;
        }
    }
    if (!segments.isEmpty()) {
        zone = QTimeZone(segments.last().toUtf8());
    }
    return zone;
}

} // namespace

std::optional<int> SystemZoneResolver::utcOffset(const QString &zoneId, const QDateTime &wallClock) const
{
    const QTimeZone zone = lookupZone(zoneId);
    if (!zone.isValid()) {
        return std::nullopt;
    }
    return zone.offsetFromUtc(QDateTime(wallClock.date(), wallClock.time(), zone));
}

void FixedOffsetZoneResolver::setOffset(const QString &zoneId, int offsetSeconds)
{
    m_offsets.insert(zoneId, offsetSeconds);
}

std::optional<int> FixedOffsetZoneResolver::utcOffset(const QString &zoneId, const QDateTime &) const
{
    const auto it = m_offsets.constFind(zoneId);
    if (it == m_offsets.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

} // namespace zone
} // namespace icalendar
