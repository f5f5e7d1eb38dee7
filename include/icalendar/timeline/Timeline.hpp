#pragma once

#include <QDateTime>
#include <QString>
#include <memory>
#include <optional>
#include <vector>

#include "icalendar/model/Values.hpp"
#include "icalendar/recurrence/RecurrenceSet.hpp"
#include "icalendar/timeline/Occurrence.hpp"
#include "icalendar/zone/TimeFrame.hpp"

namespace icalendar {
namespace model {
class Component;
}
namespace zone {
class ZoneResolver;
}

namespace timeline {

struct TimelineOptions
{
    // Zone floating values are pinned to; unset keeps them floating.
    std::optional<QString> floatingZone;
    // Most occurrences a single query returns.
    int maxOccurrences = 10000;
};

class TimelineIterator;

// Occurrences of a set of components, ordered by start. Window arguments are
// instants; values not in Qt::UTC are converted with toUTC().
class Timeline
{
public:
    explicit Timeline(const std::vector<std::shared_ptr<const model::Component>> &components,
                      TimelineOptions options = TimelineOptions(),
                      std::shared_ptr<const zone::ZoneResolver> resolver = nullptr);

    // Occurrences starting in [start, end). Throws std::invalid_argument when
    // start is after end.
    std::vector<Occurrence> query(const std::optional<QDateTime> &start,
                                  const std::optional<QDateTime> &end) const;
    // Occurrences lying completely inside [start, end].
    std::vector<Occurrence> includes(const QDateTime &start, const QDateTime &end) const;
    // Occurrences sharing at least one instant with [start, end).
    std::vector<Occurrence> overlapping(const QDateTime &start, const QDateTime &end) const;
    std::vector<Occurrence> startingAfter(const QDateTime &instant, int limit = 1) const;
    // Occurrences in progress at instant.
    std::vector<Occurrence> at(const QDateTime &instant) const;

    // Unbounded; the iterator must not outlive the timeline.
    TimelineIterator iterate(const std::optional<QDateTime> &from = std::nullopt) const;

    size_t seriesCount() const;
    const TimelineOptions &options() const;

private:
    friend class TimelineIterator;

    struct Series
    {
        std::shared_ptr<const model::Component> master;
        zone::TimeFrame frame;
        recurrence::RecurrenceSet set;
        model::Duration duration;
        bool allDay = false;
        qint64 longestSpan = 0; // seconds, overrides included
    };

    void addSeries(const std::shared_ptr<const model::Component> &master,
                   const std::vector<std::shared_ptr<const model::Component>> &overrides);
    zone::TimeFrame frameFor(const model::Component &component, const model::DateTimeValue &start) const;
    std::optional<model::Duration> explicitDuration(const model::Component &component, const QDateTime &start,
                                                    const zone::TimeFrame &frame) const;
    Occurrence materialize(const Series &series, const recurrence::ResolvedInstance &instance) const;
    qint64 longestSpan() const;

    TimelineOptions m_options;
    std::shared_ptr<const zone::ZoneResolver> m_resolver;
    std::vector<Series> m_series;
};

// Lazy merge of every series of a timeline, ascending by start; ties keep
// the order the components were given in.
class TimelineIterator
{
public:
    std::optional<Occurrence> next();

private:
    friend class Timeline;

    TimelineIterator(const Timeline &timeline, const std::optional<QDateTime> &from);

    std::optional<Occurrence> pull(size_t index);

    const Timeline *m_timeline;
    std::optional<QDateTime> m_from;
    std::vector<recurrence::RecurrenceSetIterator> m_iterators;
    std::vector<std::optional<Occurrence>> m_heads;
};

} // namespace timeline
} // namespace icalendar
