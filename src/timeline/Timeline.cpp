#include "icalendar/timeline/Timeline.hpp"

#include "icalendar/core/Logging.hpp"
#include "icalendar/model/Component.hpp"
#include "icalendar/zone/ZoneResolver.hpp"

#include <QHash>
#include <QSet>
#include <algorithm>
#include <stdexcept>

namespace icalendar {
namespace timeline {

namespace {

bool isSchedulable(model::ComponentType type)
{
    switch (type) {
    case model::ComponentType::Event:
    case model::ComponentType::Todo:
    case model::ComponentType::Journal:
    case model::ComponentType::FreeBusy:
        return true;
    default:
        return false;
    }
}

void flatten(const std::shared_ptr<const model::Component> &component,
             std::vector<std::shared_ptr<const model::Component>> &out)
{
    if (isSchedulable(component->type())) {
        out.push_back(component);
        return;
    }
    if (component->type() == model::ComponentType::Calendar) {
        for (const auto &child : component->children()) {
            flatten(child, out);
        }
        return;
    }
    qCDebug(lcTimeline) << "not placing" << component->typeName() << "on the timeline";
}

QDateTime asInstant(const QDateTime &value)
{
    if (!value.isValid()) {
        throw std::invalid_argument("invalid timeline bound");
    }
    return value.timeSpec() == Qt::UTC ? value : value.toUTC();
}

std::optional<QDateTime> asInstant(const std::optional<QDateTime> &value)
{
    if (!value) {
        return std::nullopt;
    }
    return asInstant(*value);
}

void checkWindow(const QDateTime &start, const QDateTime &end)
{
    if (start > end) {
        throw std::invalid_argument("timeline window starts after it ends");
    }
}

// Pulls from iterator until stop() holds, keeping what accept() takes. Only
// open-ended windows pass a limit.
template<typename Stop, typename Accept>
std::vector<Occurrence> gather(TimelineIterator iterator, std::optional<int> limit, Stop stop, Accept accept)
{
    std::vector<Occurrence> occurrences;
    while (auto occurrence = iterator.next()) {
        if (stop(*occurrence)) {
            break;
        }
        if (!accept(*occurrence)) {
            continue;
        }
        if (limit && static_cast<int>(occurrences.size()) >= *limit) {
            qCWarning(lcTimeline) << "timeline query stopped after" << *limit << "occurrences";
            break;
        }
        occurrences.push_back(std::move(*occurrence));
    }
    return occurrences;
}

} // namespace

Timeline::Timeline(const std::vector<std::shared_ptr<const model::Component>> &components,
                   TimelineOptions options, std::shared_ptr<const zone::ZoneResolver> resolver)
    : m_options(std::move(options))
    , m_resolver(resolver ? std::move(resolver) : std::make_shared<zone::SystemZoneResolver>())
{
    m_options.maxOccurrences = std::max(1, m_options.maxOccurrences);

    std::vector<std::shared_ptr<const model::Component>> flat;
    for (const auto &component : components) {
        if (component) {
            flatten(component, flat);
        }
    }

    const QString recurrenceId = QStringLiteral("RECURRENCE-ID");
    QSet<QString> masterUids;
    QHash<QString, std::vector<std::shared_ptr<const model::Component>>> overridesByUid;
    for (const auto &component : flat) {
        const QString uid = component->uid();
        if (!component->hasProperty(recurrenceId)) {
            masterUids.insert(uid);
        } else if (!uid.isEmpty()) {
            overridesByUid[uid].push_back(component);
        }
    }

    QSet<QString> attached;
    for (const auto &component : flat) {
        const QString uid = component->uid();
        if (!component->hasProperty(recurrenceId)) {
            if (!uid.isEmpty() && !attached.contains(uid)) {
                attached.insert(uid);
                addSeries(component, overridesByUid.value(uid));
            } else {
                addSeries(component, {});
            }
        } else if (uid.isEmpty() || !masterUids.contains(uid)) {
            qCDebug(lcTimeline) << "override of" << uid << "has no master, placing it on its own";
            addSeries(component, {});
        }
    }
}

void Timeline::addSeries(const std::shared_ptr<const model::Component> &master,
                         const std::vector<std::shared_ptr<const model::Component>> &overrides)
{
    const model::Property *startProperty = master->property(QStringLiteral("DTSTART"));
    const bool startsAtDue = !startProperty && master->type() == model::ComponentType::Todo;
    if (startsAtDue) {
        startProperty = master->property(QStringLiteral("DUE"));
    }
    if (!startProperty) {
        qCDebug(lcTimeline) << master->typeName() << master->uid() << "has no start, skipping";
        return;
    }

    model::DateTimeValue startValue;
    try {
        startValue = startProperty->dateTime();
    } catch (const model::ConversionError &error) {
        qCWarning(lcTimeline) << "skipping" << master->uid() << ":" << error.what();
        return;
    }

    Series series;
    series.master = master;
    series.frame = frameFor(*master, startValue);
    series.allDay = startValue.dateOnly;
    if (startsAtDue) {
        series.set = recurrence::RecurrenceSet(series.frame.wallClockOf(startValue, m_resolver.get()));
    } else {
        series.set = recurrence::RecurrenceSet::fromComponent(*master, overrides, series.frame, m_resolver.get());
    }

    const QDateTime start = series.set.start();
    if (auto duration = explicitDuration(*master, start, series.frame)) {
        series.duration = *duration;
    } else if (master->type() != model::ComponentType::Journal && startValue.dateOnly) {
        series.duration.days = 1;
    }
    series.longestSpan = start.secsTo(series.duration.addTo(start));

    for (const auto &component : overrides) {
        const model::Property *overrideStart = component->property(QStringLiteral("DTSTART"));
        if (!overrideStart) {
            continue;
        }
        try {
            const QDateTime wall = series.frame.wallClockOf(overrideStart->dateTime(), m_resolver.get());
            if (auto duration = explicitDuration(*component, wall, series.frame)) {
                series.longestSpan = std::max(series.longestSpan, wall.secsTo(duration->addTo(wall)));
            }
        } catch (const model::ConversionError &error) {
            qCWarning(lcTimeline) << "override of" << master->uid() << ":" << error.what();
        }
    }

    m_series.push_back(std::move(series));
}

zone::TimeFrame Timeline::frameFor(const model::Component &component, const model::DateTimeValue &start) const
{
    zone::TimeFrame frame = zone::TimeFrame::of(start);
    if (frame.kind() == zone::TimeFrame::Kind::Floating && m_options.floatingZone
        && !m_options.floatingZone->isEmpty()) {
        frame = zone::TimeFrame::zoned(*m_options.floatingZone);
    }
    if (frame.kind() == zone::TimeFrame::Kind::Zoned && !frame.isResolvable(m_resolver.get(), start.wallClock())) {
        qCWarning(lcTimeline) << "unknown time zone" << frame.zoneId() << "for" << component.uid()
                              << "- using floating time";
        frame = zone::TimeFrame::floating();
    }
    return frame;
}

std::optional<model::Duration> Timeline::explicitDuration(const model::Component &component, const QDateTime &start,
                                                          const zone::TimeFrame &frame) const
{
    try {
        if (const model::Property *duration = component.property(QStringLiteral("DURATION"))) {
            model::Duration value = duration->duration();
            if (value.negative) {
                qCDebug(lcTimeline) << "negative duration on" << component.uid() << "- using zero";
                return model::Duration();
            }
            return value;
        }
        const QString endName =
            component.type() == model::ComponentType::Todo ? QStringLiteral("DUE") : QStringLiteral("DTEND");
        if (const model::Property *end = component.property(endName)) {
            const QDateTime endWall = frame.wallClockOf(end->dateTime(), m_resolver.get());
            return model::Duration::fromSeconds(std::max<qint64>(0, start.secsTo(endWall)));
        }
    } catch (const model::ConversionError &error) {
        qCWarning(lcTimeline) << "ignoring end of" << component.uid() << ":" << error.what();
    }
    return std::nullopt;
}

Occurrence Timeline::materialize(const Series &series, const recurrence::ResolvedInstance &instance) const
{
    Occurrence occurrence;
    occurrence.master = series.master;
    occurrence.component = instance.override ? instance.override : series.master;
    occurrence.recurrenceId = instance.recurrenceId;
    occurrence.overridden = instance.overridden;
    occurrence.allDay = series.allDay;

    model::Duration duration = series.duration;
    if (instance.override) {
        if (auto own = explicitDuration(*instance.override, instance.start, series.frame)) {
            duration = *own;
        }
    }
    occurrence.start = series.frame.toInstant(instance.start, m_resolver.get());
    occurrence.end = series.frame.toInstant(duration.addTo(instance.start), m_resolver.get());
    return occurrence;
}

qint64 Timeline::longestSpan() const
{
    qint64 longest = 0;
    for (const auto &series : m_series) {
        longest = std::max(longest, series.longestSpan);
    }
    return longest;
}

std::vector<Occurrence> Timeline::query(const std::optional<QDateTime> &start,
                                        const std::optional<QDateTime> &end) const
{
    const auto from = asInstant(start);
    const auto until = asInstant(end);
    if (from && until) {
        checkWindow(*from, *until);
    }
    return gather(
        iterate(from), until ? std::nullopt : std::optional<int>(m_options.maxOccurrences),
        [&until](const Occurrence &occurrence) { return until && occurrence.start >= *until; },
        [](const Occurrence &) { return true; });
}

std::vector<Occurrence> Timeline::includes(const QDateTime &start, const QDateTime &end) const
{
    const QDateTime from = asInstant(start);
    const QDateTime until = asInstant(end);
    checkWindow(from, until);
    return gather(
        iterate(from), std::nullopt,
        [&until](const Occurrence &occurrence) { return occurrence.start > until; },
        [&until](const Occurrence &occurrence) { return occurrence.end <= until; });
}

std::vector<Occurrence> Timeline::overlapping(const QDateTime &start, const QDateTime &end) const
{
    const QDateTime from = asInstant(start);
    const QDateTime until = asInstant(end);
    checkWindow(from, until);
    return gather(
        iterate(from.addSecs(-longestSpan())), std::nullopt,
        [&until](const Occurrence &occurrence) { return occurrence.start >= until; },
        [&from](const Occurrence &occurrence) {
            return occurrence.end > from || (occurrence.start == occurrence.end && occurrence.start >= from);
        });
}

std::vector<Occurrence> Timeline::startingAfter(const QDateTime &instant, int limit) const
{
    const QDateTime from = asInstant(instant);
    std::vector<Occurrence> occurrences;
    TimelineIterator iterator = iterate(from);
    while (static_cast<int>(occurrences.size()) < limit) {
        auto occurrence = iterator.next();
        if (!occurrence) {
            break;
        }
        if (occurrence->start > from) {
            occurrences.push_back(std::move(*occurrence));
        }
    }
    return occurrences;
}

std::vector<Occurrence> Timeline::at(const QDateTime &instant) const
{
    const QDateTime moment = asInstant(instant);
    return gather(
        iterate(moment.addSecs(-longestSpan())), std::nullopt,
        [&moment](const Occurrence &occurrence) { return occurrence.start > moment; },
        [&moment](const Occurrence &occurrence) {
            return moment < occurrence.end || (occurrence.start == occurrence.end && occurrence.start == moment);
        });
}

TimelineIterator Timeline::iterate(const std::optional<QDateTime> &from) const
{
    return TimelineIterator(*this, asInstant(from));
}

size_t Timeline::seriesCount() const
{
    return m_series.size();
}

const TimelineOptions &Timeline::options() const
{
    return m_options;
}

TimelineIterator::TimelineIterator(const Timeline &timeline, const std::optional<QDateTime> &from)
    : m_timeline(&timeline)
    , m_from(from)
{
    for (const auto &series : timeline.m_series) {
        std::optional<QDateTime> wallFrom;
        if (from) {
            // A day of slack covers offset differences between the frames.
            wallFrom = series.frame.fromInstant(*from, timeline.m_resolver.get()).addDays(-1);
        }
        m_iterators.push_back(series.set.iterate(wallFrom));
    }
    for (size_t i = 0; i < m_iterators.size(); ++i) {
        m_heads.push_back(pull(i));
    }
}

std::optional<Occurrence> TimelineIterator::pull(size_t index)
{
    const Timeline::Series &series = m_timeline->m_series[index];
    while (auto instance = m_iterators[index].next()) {
        Occurrence occurrence = m_timeline->materialize(series, *instance);
        if (m_from && occurrence.start < *m_from) {
            continue;
        }
        return occurrence;
    }
    return std::nullopt;
}

std::optional<Occurrence> TimelineIterator::next()
{
    std::optional<size_t> earliest;
    for (size_t i = 0; i < m_heads.size(); ++i) {
        if (m_heads[i] && (!earliest || m_heads[i]->start < m_heads[*earliest]->start)) {
            earliest = i;
        }
    }
    if (!earliest) {
        return std::nullopt;
    }
    std::optional<Occurrence> occurrence = std::move(m_heads[*earliest]);
    m_heads[*earliest] = pull(*earliest);
    return occurrence;
}

} // namespace timeline
} // namespace icalendar
