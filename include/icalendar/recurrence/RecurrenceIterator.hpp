#pragma once

#include <QDateTime>
#include <optional>
#include <vector>

#include "icalendar/recurrence/RecurrenceRule.hpp"

namespace icalendar {
namespace recurrence {

// Where an iteration stands: the cadence step being consumed, how many
// instants were produced so far and the last one. Feeding it back into a
// new iterator continues the sequence exactly where it stopped.
struct RecurrenceCursor
{
    qint64 step = 0;
    int produced = 0;
    QDateTime last;
};

// Pull-based expansion of one rule from an anchor (DTSTART). All values are
// wall-clock QDateTimes (Qt::UTC spec, no zone applied). Instants come out
// strictly ascending, never before the anchor, never after UNTIL and at most
// COUNT of them. Unbounded rules are only generated as far as they are pulled.
class RecurrenceIterator
{
public:
    RecurrenceIterator(RecurrenceRule rule, QDateTime anchor, std::optional<QDateTime> until = std::nullopt);
    RecurrenceIterator(RecurrenceRule rule, QDateTime anchor, const RecurrenceCursor &cursor,
                       std::optional<QDateTime> until = std::nullopt);

    std::optional<QDateTime> next();

    // Subsequent next() calls return nothing earlier than instant. Without
    // COUNT, whole cadence steps before it are skipped unseen.
    void skipTo(const QDateTime &instant);

    RecurrenceCursor position() const;
    bool isFinished() const;

    // Candidate set of one cadence step after BYxxx expansion/restriction
    // and BYSETPOS, before the anchor/UNTIL/COUNT bounds are applied.
    static std::vector<QDateTime> candidatesForStep(const RecurrenceRule &rule, const QDateTime &anchor, qint64 step);

    // Inclusive UNTIL bound as a wall clock; a date-only UNTIL covers the day.
    static QDateTime untilBoundary(const model::DateTimeValue &until);

private:
    bool fillBuffer();
    void skipRejectedDay(qint64 emptyStep);

    RecurrenceRule m_rule; // with the anchor's defaults filled in
    QDateTime m_anchor;
    std::optional<QDateTime> m_until;
    QDateTime m_skipBefore;

    qint64 m_step = 0;
    qint64 m_bufferStep = 0;
    std::vector<QDateTime> m_buffer;
    size_t m_index = 0;
    int m_produced = 0;
    QDateTime m_last;
    QDateTime m_lastHit;
    int m_emptyRun = 0;
    bool m_finished = false;
};

// Everything up to and including windowEndHint (all of it for rules with
// COUNT or UNTIL when no hint is given; capped by limit otherwise).
std::vector<QDateTime> expand(const RecurrenceRule &rule, const QDateTime &anchor,
                              const std::optional<QDateTime> &windowEndHint, int limit = 10000);

} // namespace recurrence
} // namespace icalendar
