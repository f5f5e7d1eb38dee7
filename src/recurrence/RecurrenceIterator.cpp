#include "icalendar/recurrence/RecurrenceIterator.hpp"

#include "icalendar/core/Logging.hpp"

#include <algorithm>
#include <numeric>

namespace icalendar {
namespace recurrence {

namespace {
constexpr int MaxYear = 9999;
// A day pattern that has not matched for a whole Gregorian cycle never will.
constexpr qint64 SilentDaysLimit = 400 * 366;
constexpr int MinEmptySteps = 8;
// Upper bound on consecutive empty cadence steps regardless of elapsed time.
constexpr int MaxEmptySteps = 1 << 20;
constexpr qint64 SecondsPerDay = 86400;

enum class OrdinalScope
{
    None,
    Month,
    Year,
};

qint64 unitSeconds(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Hourly:
        return 3600;
    case Frequency::Minutely:
        return 60;
    case Frequency::Secondly:
        return 1;
    default:
        return 86400;
    }
}

bool isSubDaily(Frequency frequency)
{
    return frequency == Frequency::Hourly || frequency == Frequency::Minutely || frequency == Frequency::Secondly;
}

bool matchesSigned(const QList<int> &values, int position, int total)
{
    for (int value : values) {
        if ((value > 0 && value == position) || (value < 0 && total + value + 1 == position)) {
            return true;
        }
    }
    return false;
}

bool matchesWeekday(const WeekdayNum &entry, const QDate &date, OrdinalScope scope)
{
    if (date.dayOfWeek() != entry.day) {
        return false;
    }
    if (entry.ordinal == 0 || scope == OrdinalScope::None) {
        return true;
    }
    const int position = scope == OrdinalScope::Month ? date.day() : date.dayOfYear();
    const int total = scope == OrdinalScope::Month ? date.daysInMonth() : date.daysInYear();
    const int fromStart = (position - 1) / 7 + 1;
    const int fromEnd = (total - position) / 7 + 1;
    return entry.ordinal > 0 ? fromStart == entry.ordinal : fromEnd == -entry.ordinal;
}

bool dayMatches(const RecurrenceRule &rule, const QDate &date, OrdinalScope scope)
{
    if (!rule.byMonth.isEmpty() && !rule.byMonth.contains(date.month())) {
        return false;
    }
    if (!rule.byYearDay.isEmpty() && !matchesSigned(rule.byYearDay, date.dayOfYear(), date.daysInYear())) {
        return false;
    }
    if (!rule.byMonthDay.isEmpty() && !matchesSigned(rule.byMonthDay, date.day(), date.daysInMonth())) {
        return false;
    }
    if (!rule.byDay.isEmpty()) {
        return std::any_of(rule.byDay.cbegin(), rule.byDay.cend(),
                           [&](const WeekdayNum &entry) { return matchesWeekday(entry, date, scope); });
    }
    return true;
}

QDate startOfWeek(const QDate &date, Qt::DayOfWeek weekStart)
{
    return date.addDays(-((date.dayOfWeek() - weekStart + 7) % 7));
}

// Week 1 is the first week holding at least four days of the year.
QDate weekOneStart(int year, Qt::DayOfWeek weekStart)
{
    const QDate janFirst(year, 1, 1);
    const QDate start = startOfWeek(janFirst, weekStart);
    return start.daysTo(janFirst) > 3 ? start.addDays(7) : start;
}

void collectDays(const RecurrenceRule &rule, const QDate &first, int count, OrdinalScope scope,
                 std::vector<QDate> *days)
{
    for (int i = 0; i < count; ++i) {
        const QDate date = first.addDays(i);
        if (dayMatches(rule, date, scope)) {
            days->push_back(date);
        }
    }
}

std::vector<QDate> yearDays(const RecurrenceRule &rule, int year)
{
    std::vector<QDate> days;
    if (!rule.byWeekNo.isEmpty()) {
        const QDate first = weekOneStart(year, rule.weekStart);
        const int weeks = static_cast<int>(first.daysTo(weekOneStart(year + 1, rule.weekStart)) / 7);
        QList<int> numbers;
        for (int week : rule.byWeekNo) {
            const int number = week > 0 ? week : weeks + week + 1;
            if (number >= 1 && number <= weeks && !numbers.contains(number)) {
                numbers << number;
            }
        }
        std::sort(numbers.begin(), numbers.end());
        for (int number : numbers) {
            collectDays(rule, first.addDays((number - 1) * 7), 7, OrdinalScope::None, &days);
        }
        return days;
    }

    const OrdinalScope scope = rule.byMonth.isEmpty() ? OrdinalScope::Year : OrdinalScope::Month;
    const QDate janFirst(year, 1, 1);
    collectDays(rule, janFirst, janFirst.daysInYear(), scope, &days);
    return days;
}

QDateTime subDailyBase(const RecurrenceRule &rule, const QDateTime &anchor)
{
    const QTime time = anchor.time();
    switch (rule.frequency) {
    case Frequency::Hourly:
        return QDateTime(anchor.date(), QTime(time.hour(), 0, 0), Qt::UTC);
    case Frequency::Minutely:
        return QDateTime(anchor.date(), QTime(time.hour(), time.minute(), 0), Qt::UTC);
    default:
        return QDateTime(anchor.date(), QTime(time.hour(), time.minute(), time.second()), Qt::UTC);
    }
}

// First instant covered by a cadence step; nothing the step produces lies
// before it.
QDateTime periodStart(const RecurrenceRule &rule, const QDateTime &anchor, qint64 step)
{
    const qint64 offset = step * rule.interval;
    const QDate date = anchor.date();
    switch (rule.frequency) {
    case Frequency::Yearly: {
        const qint64 year = date.year() + offset;
        if (year > MaxYear) {
            return QDateTime();
        }
        QDate first(static_cast<int>(year), 1, 1);
        if (!rule.byWeekNo.isEmpty()) {
            first = first.addDays(-7);
        }
        return QDateTime(first, QTime(0, 0), Qt::UTC);
    }
    case Frequency::Monthly: {
        const qint64 months = static_cast<qint64>(date.year()) * 12 + date.month() - 1 + offset;
        if (months / 12 > MaxYear) {
            return QDateTime();
        }
        return QDateTime(QDate(static_cast<int>(months / 12), static_cast<int>(months % 12) + 1, 1), QTime(0, 0),
                         Qt::UTC);
    }
    case Frequency::Weekly:
        return QDateTime(startOfWeek(date, rule.weekStart).addDays(7 * offset), QTime(0, 0), Qt::UTC);
    case Frequency::Daily:
        return QDateTime(date.addDays(offset), QTime(0, 0), Qt::UTC);
    case Frequency::Hourly:
    case Frequency::Minutely:
    case Frequency::Secondly:
        return subDailyBase(rule, anchor).addSecs(offset * unitSeconds(rule.frequency));
    }
    return QDateTime();
}

// Fills in what the anchor implies: the day pattern of coarse frequencies
// without day-level parts, and the time parts coarser than the frequency.
RecurrenceRule withDefaults(const RecurrenceRule &rule, const QDateTime &anchor)
{
    RecurrenceRule effective = rule;
    const QDate date = anchor.date();
    const QTime time = anchor.time();

    const bool noDayParts = rule.byWeekNo.isEmpty() && rule.byYearDay.isEmpty() && rule.byMonthDay.isEmpty()
        && rule.byDay.isEmpty();
    if (noDayParts) {
        switch (rule.frequency) {
        case Frequency::Yearly:
            if (effective.byMonth.isEmpty()) {
                effective.byMonth << date.month();
            }
            effective.byMonthDay << date.day();
            break;
        case Frequency::Monthly:
            effective.byMonthDay << date.day();
            break;
        case Frequency::Weekly:
            effective.byDay << WeekdayNum { 0, static_cast<Qt::DayOfWeek>(date.dayOfWeek()) };
            break;
        default:
            break;
        }
    }

    if (rule.frequency > Frequency::Hourly && effective.byHour.isEmpty()) {
        effective.byHour << time.hour();
    }
    if (rule.frequency > Frequency::Minutely && effective.byMinute.isEmpty()) {
        effective.byMinute << time.minute();
    }
    if (rule.frequency > Frequency::Secondly && effective.bySecond.isEmpty()) {
        effective.bySecond << time.second();
    }
    return effective;
}

void appendTimes(const QDate &date, const QList<int> &hours, const QList<int> &minutes, const QList<int> &seconds,
                 std::vector<QDateTime> *out)
{
    for (int hour : hours) {
        for (int minute : minutes) {
            for (int second : seconds) {
                const QTime time(hour, minute, second);
                if (time.isValid()) {
                    out->push_back(QDateTime(date, time, Qt::UTC));
                }
            }
        }
    }
}

std::vector<QDateTime> applySetPositions(const QList<int> &positions, const std::vector<QDateTime> &candidates)
{
    const int total = static_cast<int>(candidates.size());
    std::vector<QDateTime> selected;
    for (int position : positions) {
        const int index = position > 0 ? position - 1 : total + position;
        if (index >= 0 && index < total) {
            selected.push_back(candidates[static_cast<size_t>(index)]);
        }
    }
    std::sort(selected.begin(), selected.end());
    selected.erase(std::unique(selected.begin(), selected.end()), selected.end());
    return selected;
}

std::vector<QDateTime> expandStep(const RecurrenceRule &rule, const QDateTime &anchor, qint64 step)
{
    std::vector<QDateTime> candidates;
    const QDateTime start = periodStart(rule, anchor, step);
    if (!start.isValid()) {
        return candidates;
    }

    switch (rule.frequency) {
    case Frequency::Yearly:
    case Frequency::Monthly:
    case Frequency::Weekly:
    case Frequency::Daily: {
        std::vector<QDate> days;
        if (rule.frequency == Frequency::Yearly) {
            days = yearDays(rule, start.date().addDays(rule.byWeekNo.isEmpty() ? 0 : 7).year());
        } else if (rule.frequency == Frequency::Monthly) {
            collectDays(rule, start.date(), start.date().daysInMonth(), OrdinalScope::Month, &days);
        } else if (rule.frequency == Frequency::Weekly) {
            collectDays(rule, start.date(), 7, OrdinalScope::None, &days);
        } else {
            collectDays(rule, start.date(), 1, OrdinalScope::None, &days);
        }
        for (const QDate &day : days) {
            appendTimes(day, rule.byHour, rule.byMinute, rule.bySecond, &candidates);
        }
        break;
    }
    case Frequency::Hourly:
    case Frequency::Minutely:
    case Frequency::Secondly: {
        const QTime time = start.time();
        if (!dayMatches(rule, start.date(), OrdinalScope::None)) {
            break;
        }
        if (!rule.byHour.isEmpty() && !rule.byHour.contains(time.hour())) {
            break;
        }
        if (rule.frequency != Frequency::Hourly && !rule.byMinute.isEmpty()
            && !rule.byMinute.contains(time.minute())) {
            break;
        }
        if (rule.frequency == Frequency::Secondly) {
            if (rule.bySecond.isEmpty() || rule.bySecond.contains(time.second())) {
                candidates.push_back(start);
            }
            break;
        }
        const QList<int> minutes = rule.frequency == Frequency::Hourly ? rule.byMinute : QList<int> { time.minute() };
        appendTimes(start.date(), { time.hour() }, minutes, rule.bySecond, &candidates);
        break;
    }
    }

    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
    if (!rule.bySetPos.isEmpty()) {
        return applySetPositions(rule.bySetPos, candidates);
    }
    return candidates;
}

// Whether any step start of a sub-daily cadence passes the BYHOUR, BYMINUTE
// and BYSECOND limits. Step starts repeat modulo a day with period
// gcd(step, day), so one pass over that orbit decides it.
bool cadenceMeetsTimes(const RecurrenceRule &rule, const QDateTime &anchor)
{
    if (!isSubDaily(rule.frequency)) {
        return true;
    }
    const qint64 stride = std::gcd(unitSeconds(rule.frequency) * rule.interval, SecondsPerDay);
    const qint64 base = QTime(0, 0).secsTo(subDailyBase(rule, anchor).time());
    for (qint64 offset = 0; offset < SecondsPerDay; offset += stride) {
        const QTime time = QTime(0, 0).addSecs(static_cast<int>((base + offset) % SecondsPerDay));
        if (!rule.byHour.isEmpty() && !rule.byHour.contains(time.hour())) {
            continue;
        }
        if (rule.frequency != Frequency::Hourly && !rule.byMinute.isEmpty()
            && !rule.byMinute.contains(time.minute())) {
            continue;
        }
        if (rule.frequency == Frequency::Secondly && !rule.bySecond.isEmpty()
            && !rule.bySecond.contains(time.second())) {
            continue;
        }
        return true;
    }
    return false;
}

// Number of cadence steps from the anchor to the step covering instant,
// rounded down and kept one step early so nothing in range is skipped.
qint64 stepBefore(const RecurrenceRule &rule, const QDateTime &anchor, const QDateTime &instant)
{
    const QDate from = anchor.date();
    const QDate to = instant.date();
    qint64 units = 0;
    switch (rule.frequency) {
    case Frequency::Yearly:
        units = to.year() - from.year();
        break;
    case Frequency::Monthly:
        units = (static_cast<qint64>(to.year()) * 12 + to.month()) - (static_cast<qint64>(from.year()) * 12 + from.month());
        break;
    case Frequency::Weekly:
        units = startOfWeek(from, rule.weekStart).daysTo(to) / 7;
        break;
    case Frequency::Daily:
        units = from.daysTo(to);
        break;
    case Frequency::Hourly:
    case Frequency::Minutely:
    case Frequency::Secondly:
        units = subDailyBase(rule, anchor).secsTo(instant) / unitSeconds(rule.frequency);
        break;
    }
    return qMax<qint64>(0, units / rule.interval - 1);
}

} // namespace

RecurrenceIterator::RecurrenceIterator(RecurrenceRule rule, QDateTime anchor, std::optional<QDateTime> until)
    : m_rule(withDefaults(rule, anchor))
    , m_anchor(std::move(anchor))
    , m_until(std::move(until))
    , m_lastHit(m_anchor)
{
    if (!m_until && rule.until) {
        m_until = untilBoundary(*rule.until);
    }
    const QString definitionError = rule.definitionError();
    if (!definitionError.isEmpty()) {
        qCWarning(lcRecurrence) << "rule expands to nothing:" << definitionError;
        m_finished = true;
    }
    if (!m_anchor.isValid()) {
        m_finished = true;
    } else if (!m_finished && !cadenceMeetsTimes(m_rule, m_anchor)) {
        qCWarning(lcRecurrence) << "rule expands to nothing: time parts never meet the" << rule.interval
                                << "step cadence from" << m_anchor;
        m_finished = true;
    }
}

RecurrenceIterator::RecurrenceIterator(RecurrenceRule rule, QDateTime anchor, const RecurrenceCursor &cursor,
                                       std::optional<QDateTime> until)
    : RecurrenceIterator(std::move(rule), std::move(anchor), std::move(until))
{
    m_step = cursor.step;
    m_produced = cursor.produced;
    m_last = cursor.last;
    if (m_last.isValid()) {
        m_lastHit = m_last;
    }
}

std::optional<QDateTime> RecurrenceIterator::next()
{
    for (;;) {
        while (m_index < m_buffer.size()) {
            const QDateTime candidate = m_buffer[m_index++];
            if (candidate < m_anchor || (m_last.isValid() && candidate <= m_last)) {
                continue;
            }
            if ((m_until && candidate > *m_until) || (m_rule.count && m_produced >= *m_rule.count)) {
                m_finished = true;
                m_buffer.clear();
                m_index = 0;
                return std::nullopt;
            }
            ++m_produced;
            m_last = candidate;
            if (m_skipBefore.isValid() && candidate < m_skipBefore) {
                continue;
            }
            return candidate;
        }
        if (m_finished || !fillBuffer()) {
            m_finished = true;
            return std::nullopt;
        }
    }
}

bool RecurrenceIterator::fillBuffer()
{
    for (;;) {
        const QDateTime start = periodStart(m_rule, m_anchor, m_step);
        if (!start.isValid()) {
            return false;
        }
        if (m_until && start > *m_until) {
            return false;
        }
        const qint64 step = m_step++;
        std::vector<QDateTime> candidates = expandStep(m_rule, m_anchor, step);
        if (!candidates.empty()) {
            m_buffer = std::move(candidates);
            m_index = 0;
            m_bufferStep = step;
            m_emptyRun = 0;
            m_lastHit = m_buffer.back();
            return true;
        }
        ++m_emptyRun;
        if (m_emptyRun >= MaxEmptySteps
            || (m_emptyRun >= MinEmptySteps && m_lastHit.daysTo(start) > SilentDaysLimit)) {
            qCDebug(lcRecurrence) << "rule stopped matching after" << m_lastHit;
            return false;
        }
        skipRejectedDay(step);
    }
}

void RecurrenceIterator::skipRejectedDay(qint64 emptyStep)
{
    if (!isSubDaily(m_rule.frequency)) {
        return;
    }
    const QDateTime start = periodStart(m_rule, m_anchor, emptyStep);
    if (dayMatches(m_rule, start.date(), OrdinalScope::None)) {
        return;
    }
    const qint64 stepSeconds = unitSeconds(m_rule.frequency) * m_rule.interval;
    const qint64 toMidnight = start.secsTo(QDateTime(start.date().addDays(1), QTime(0, 0), Qt::UTC));
    m_step = qMax(m_step, emptyStep + (toMidnight + stepSeconds - 1) / stepSeconds);
}

void RecurrenceIterator::skipTo(const QDateTime &instant)
{
    if (!instant.isValid()) {
        return;
    }
    if (!m_skipBefore.isValid() || instant > m_skipBefore) {
        m_skipBefore = instant;
    }
    if (m_rule.count || m_finished) {
        return;
    }
    const qint64 target = stepBefore(m_rule, m_anchor, instant);
    if (target > m_step) {
        m_step = target;
        m_buffer.clear();
        m_index = 0;
        const QDateTime start = periodStart(m_rule, m_anchor, target);
        if (start.isValid()) {
            m_lastHit = start;
            m_emptyRun = 0;
        }
    }
}

RecurrenceCursor RecurrenceIterator::position() const
{
    RecurrenceCursor cursor;
    cursor.step = m_index < m_buffer.size() ? m_bufferStep : m_step;
    cursor.produced = m_produced;
    cursor.last = m_last;
    return cursor;
}

bool RecurrenceIterator::isFinished() const
{
    return m_finished;
}

std::vector<QDateTime> RecurrenceIterator::candidatesForStep(const RecurrenceRule &rule, const QDateTime &anchor,
                                                             qint64 step)
{
    if (!rule.isValid() || !anchor.isValid() || step < 0) {
        return {};
    }
    return expandStep(withDefaults(rule, anchor), anchor, step);
}

QDateTime RecurrenceIterator::untilBoundary(const model::DateTimeValue &until)
{
    if (until.dateOnly) {
        return QDateTime(until.date, QTime(23, 59, 59), Qt::UTC);
    }
    return until.wallClock();
}

std::vector<QDateTime> expand(const RecurrenceRule &rule, const QDateTime &anchor,
                              const std::optional<QDateTime> &windowEndHint, int limit)
{
    std::vector<QDateTime> instants;
    RecurrenceIterator iterator(rule, anchor);
    while (static_cast<int>(instants.size()) < limit) {
        const auto instant = iterator.next();
        if (!instant || (windowEndHint && *instant > *windowEndHint)) {
            break;
        }
        instants.push_back(*instant);
    }
    return instants;
}

} // namespace recurrence
} // namespace icalendar
