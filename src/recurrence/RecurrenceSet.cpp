#include "icalendar/recurrence/RecurrenceSet.hpp"

#include "icalendar/core/Logging.hpp"
#include "icalendar/model/Component.hpp"
#include "icalendar/zone/TimeFrame.hpp"

#include <algorithm>

namespace icalendar {
namespace recurrence {

namespace {

std::optional<QDateTime> untilInFrame(const RecurrenceRule &rule, const zone::TimeFrame &frame,
                                      const zone::ZoneResolver *resolver)
{
    if (!rule.until) {
        return std::nullopt;
    }
    if (rule.until->dateOnly) {
        return RecurrenceIterator::untilBoundary(*rule.until);
    }
    return frame.wallClockOf(*rule.until, resolver);
}

} // namespace

RecurrenceSet::RecurrenceSet(QDateTime start)
    : m_start(std::move(start))
{
}

void RecurrenceSet::addRule(RecurrenceRule rule, std::optional<QDateTime> until)
{
    m_rules.push_back({ std::move(rule), std::move(until) });
}

void RecurrenceSet::addExclusionRule(RecurrenceRule rule, std::optional<QDateTime> until)
{
    m_exclusionRules.push_back({ std::move(rule), std::move(until) });
}

void RecurrenceSet::addDate(const QDateTime &instant)
{
    if (instant.isValid()) {
        m_additions.insert(instant);
    }
}

void RecurrenceSet::excludeDate(const QDateTime &instant)
{
    if (instant.isValid()) {
        m_exclusions.insert(instant);
    }
}

void RecurrenceSet::excludeDay(const QDate &day)
{
    if (day.isValid()) {
        m_excludedDays.insert(day);
    }
}

void RecurrenceSet::addOverride(const QDateTime &recurrenceId, const QDateTime &start,
                                std::shared_ptr<const model::Component> component)
{
    if (!recurrenceId.isValid()) {
        return;
    }
    m_overrides[recurrenceId] = Override { start.isValid() ? start : recurrenceId, std::move(component) };
}

const QDateTime &RecurrenceSet::start() const
{
    return m_start;
}

bool RecurrenceSet::isRecurring() const
{
    return !m_rules.empty() || !m_additions.empty() || !m_overrides.empty();
}

bool RecurrenceSet::isFinite() const
{
    return std::all_of(m_rules.cbegin(), m_rules.cend(), [](const BoundRule &bound) {
        return !bound.rule.isValid() || bound.rule.count || bound.rule.until || bound.until;
    });
}

std::vector<ResolvedInstance> RecurrenceSet::resolve(const std::optional<QDateTime> &windowStart,
                                                     const std::optional<QDateTime> &windowEnd, int limit) const
{
    std::vector<ResolvedInstance> instances;
    RecurrenceSetIterator iterator = iterate(windowStart);
    while (windowEnd || static_cast<int>(instances.size()) < limit) {
        auto instance = iterator.next();
        if (!instance || (windowEnd && instance->start >= *windowEnd)) {
            break;
        }
        if (windowStart && instance->start < *windowStart) {
            continue;
        }
        instances.push_back(std::move(*instance));
    }
    return instances;
}

RecurrenceSetIterator RecurrenceSet::iterate(const std::optional<QDateTime> &from) const
{
    return RecurrenceSetIterator(*this, from);
}

RecurrenceSet RecurrenceSet::fromComponent(const model::Component &master,
                                           const std::vector<std::shared_ptr<const model::Component>> &overrides,
                                           const zone::TimeFrame &frame, const zone::ZoneResolver *resolver)
{
    const model::Property *dtstart = master.property(QStringLiteral("DTSTART"));
    if (!dtstart) {
        return RecurrenceSet();
    }
    model::DateTimeValue startValue;
    try {
        startValue = dtstart->dateTime();
    } catch (const model::ConversionError &error) {
        qCWarning(lcRecurrence) << "series without usable start:" << error.what();
        return RecurrenceSet();
    }

    RecurrenceSet set(frame.wallClockOf(startValue, resolver));

    auto forEachConverted = [&master](const char *name, const auto &apply) {
        for (const model::Property *property : master.propertiesNamed(QLatin1String(name))) {
            try {
                apply(*property);
            } catch (const model::ConversionError &error) {
                qCWarning(lcRecurrence) << "ignoring" << name << "of" << master.uid() << ":" << error.what();
            }
        }
    };

    forEachConverted("RRULE", [&](const model::Property &property) {
        const RecurrenceRule &rule = property.recurrenceRule();
        set.addRule(rule, untilInFrame(rule, frame, resolver));
    });
    forEachConverted("EXRULE", [&](const model::Property &property) {
        const RecurrenceRule &rule = property.recurrenceRule();
        set.addExclusionRule(rule, untilInFrame(rule, frame, resolver));
    });
    forEachConverted("RDATE", [&](const model::Property &property) {
        for (const model::DateTimeValue &value : property.dateTimes()) {
            set.addDate(frame.wallClockOf(value, resolver));
        }
    });
    forEachConverted("EXDATE", [&](const model::Property &property) {
        for (const model::DateTimeValue &value : property.dateTimes()) {
            if (value.dateOnly && !startValue.dateOnly) {
                set.excludeDay(value.date);
            } else {
                set.excludeDate(frame.wallClockOf(value, resolver));
            }
        }
    });

    for (const auto &component : overrides) {
        const model::Property *recurrenceId = component->property(QStringLiteral("RECURRENCE-ID"));
        if (!recurrenceId) {
            continue;
        }
        try {
            const model::DateTimeValue idValue = recurrenceId->dateTime();
            QDateTime key = frame.wallClockOf(idValue, resolver);
            if (idValue.dateOnly && !startValue.dateOnly) {
                key.setTime(set.m_start.time());
            }
            QDateTime start;
            if (const model::Property *overrideStart = component->property(QStringLiteral("DTSTART"))) {
                start = frame.wallClockOf(overrideStart->dateTime(), resolver);
            }
            set.addOverride(key, start, component);
        } catch (const model::ConversionError &error) {
            qCWarning(lcRecurrence) << "ignoring override of" << master.uid() << ":" << error.what();
        }
    }
    return set;
}

RecurrenceSetIterator::RecurrenceSetIterator(const RecurrenceSet &set, const std::optional<QDateTime> &from)
    : m_exclusions(set.m_exclusions)
    , m_excludedDays(set.m_excludedDays)
{
    if (!set.m_start.isValid()) {
        m_baseDone = true;
        return;
    }

    for (const auto &bound : set.m_rules) {
        RecurrenceIterator iterator(bound.rule, set.m_start, bound.until);
        if (from) {
            iterator.skipTo(*from);
        }
        m_ruleHeads.push_back(iterator.next());
        m_rules.push_back(std::move(iterator));
    }
    for (const auto &bound : set.m_exclusionRules) {
        RecurrenceIterator iterator(bound.rule, set.m_start, bound.until);
        if (from) {
            iterator.skipTo(*from);
        }
        m_exclusionHeads.push_back(iterator.next());
        m_exclusionRules.push_back(std::move(iterator));
    }

    std::set<QDateTime> additions = set.m_additions;
    additions.insert(set.m_start);
    for (const QDateTime &instant : additions) {
        if (!from || instant >= *from) {
            m_additions.push_back(instant);
        }
    }

    for (const auto &entry : set.m_overrides) {
        m_overriddenIds.insert(entry.first);
        if (from && entry.second.start < *from) {
            continue;
        }
        ResolvedInstance instance;
        instance.start = entry.second.start;
        instance.recurrenceId = entry.first;
        instance.overridden = true;
        instance.override = entry.second.component;
        m_overrides.push_back(std::move(instance));
    }
    std::stable_sort(m_overrides.begin(), m_overrides.end(),
                     [](const ResolvedInstance &lhs, const ResolvedInstance &rhs) { return lhs.start < rhs.start; });
}

bool RecurrenceSetIterator::isExcluded(const QDateTime &instant)
{
    if (m_exclusions.count(instant) > 0 || m_excludedDays.count(instant.date()) > 0) {
        return true;
    }
    for (size_t i = 0; i < m_exclusionRules.size(); ++i) {
        auto &head = m_exclusionHeads[i];
        while (head && *head < instant) {
            head = m_exclusionRules[i].next();
        }
        if (head && *head == instant) {
            return true;
        }
    }
    return false;
}

std::optional<QDateTime> RecurrenceSetIterator::nextBase()
{
    for (;;) {
        std::optional<QDateTime> earliest;
        for (const auto &head : m_ruleHeads) {
            if (head && (!earliest || *head < *earliest)) {
                earliest = head;
            }
        }
        if (m_additionIndex < m_additions.size()
            && (!earliest || m_additions[m_additionIndex] < *earliest)) {
            earliest = m_additions[m_additionIndex];
        }
        if (!earliest) {
            return std::nullopt;
        }

        // Equal instants from independent sources collapse into one.
        for (size_t i = 0; i < m_rules.size(); ++i) {
            while (m_ruleHeads[i] && *m_ruleHeads[i] == *earliest) {
                m_ruleHeads[i] = m_rules[i].next();
            }
        }
        while (m_additionIndex < m_additions.size() && m_additions[m_additionIndex] == *earliest) {
            ++m_additionIndex;
        }

        if (isExcluded(*earliest) || m_overriddenIds.count(*earliest) > 0) {
            continue;
        }
        return earliest;
    }
}

std::optional<ResolvedInstance> RecurrenceSetIterator::next()
{
    if (!m_pendingBase && !m_baseDone) {
        m_pendingBase = nextBase();
        m_baseDone = !m_pendingBase;
    }
    const bool haveOverride = m_overrideIndex < m_overrides.size();
    if (m_pendingBase && (!haveOverride || *m_pendingBase <= m_overrides[m_overrideIndex].start)) {
        ResolvedInstance instance;
        instance.start = *m_pendingBase;
        instance.recurrenceId = *m_pendingBase;
        m_pendingBase.reset();
        return instance;
    }
    if (haveOverride) {
        return m_overrides[m_overrideIndex++];
    }
    return std::nullopt;
}

} // namespace recurrence
} // namespace icalendar
