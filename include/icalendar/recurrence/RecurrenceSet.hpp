#pragma once

#include <QDate>
#include <QDateTime>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "icalendar/recurrence/RecurrenceIterator.hpp"
#include "icalendar/recurrence/RecurrenceRule.hpp"

namespace icalendar {
namespace model {
class Component;
}
namespace zone {
class TimeFrame;
class ZoneResolver;
}

namespace recurrence {

struct ResolvedInstance
{
    QDateTime start;        // where the instance actually starts
    QDateTime recurrenceId; // the instant the series generated for it
    bool overridden = false;
    std::shared_ptr<const model::Component> override;
};

class RecurrenceSetIterator;

// RRULEs and RDATEs minus EXRULEs and EXDATEs, with RECURRENCE-ID overrides
// spliced in. All instants are wall clocks of one frame (see zone::TimeFrame).
class RecurrenceSet
{
public:
    static constexpr int DefaultLimit = 10000;

    explicit RecurrenceSet(QDateTime start = QDateTime());

    void addRule(RecurrenceRule rule, std::optional<QDateTime> until = std::nullopt);
    void addExclusionRule(RecurrenceRule rule, std::optional<QDateTime> until = std::nullopt);
    void addDate(const QDateTime &instant);
    void excludeDate(const QDateTime &instant);
    // A date-only exclusion against a date-time series drops the whole day.
    void excludeDay(const QDate &day);
    void addOverride(const QDateTime &recurrenceId, const QDateTime &start,
                     std::shared_ptr<const model::Component> component);

    const QDateTime &start() const;
    bool isRecurring() const;
    // False when some rule has neither COUNT nor UNTIL.
    bool isFinite() const;

    // Instances starting in [windowStart, windowEnd), ascending. Without a
    // windowEnd at most limit are returned.
    std::vector<ResolvedInstance> resolve(const std::optional<QDateTime> &windowStart,
                                          const std::optional<QDateTime> &windowEnd,
                                          int limit = DefaultLimit) const;

    RecurrenceSetIterator iterate(const std::optional<QDateTime> &from = std::nullopt) const;

    // Reads DTSTART, RRULE, RDATE, EXRULE and EXDATE of master (and the
    // RECURRENCE-ID/DTSTART of each override) into frame's wall clock.
    // Properties that fail to convert are logged and left out.
    static RecurrenceSet fromComponent(const model::Component &master,
                                       const std::vector<std::shared_ptr<const model::Component>> &overrides,
                                       const zone::TimeFrame &frame, const zone::ZoneResolver *resolver);

private:
    friend class RecurrenceSetIterator;

    struct BoundRule
    {
        RecurrenceRule rule;
        std::optional<QDateTime> until;
    };

    struct Override
    {
        QDateTime start;
        std::shared_ptr<const model::Component> component;
    };

    QDateTime m_start;
    std::vector<BoundRule> m_rules;
    std::vector<BoundRule> m_exclusionRules;
    std::set<QDateTime> m_additions;
    std::set<QDateTime> m_exclusions;
    std::set<QDate> m_excludedDays;
    std::map<QDateTime, Override> m_overrides;
};

// Lazy merge of a RecurrenceSet; nothing is generated beyond what is pulled.
class RecurrenceSetIterator
{
public:
    std::optional<ResolvedInstance> next();

private:
    friend class RecurrenceSet;

    RecurrenceSetIterator(const RecurrenceSet &set, const std::optional<QDateTime> &from);

    std::optional<QDateTime> nextBase();
    bool isExcluded(const QDateTime &instant);

    std::vector<RecurrenceIterator> m_rules;
    std::vector<std::optional<QDateTime>> m_ruleHeads;
    std::vector<RecurrenceIterator> m_exclusionRules;
    std::vector<std::optional<QDateTime>> m_exclusionHeads;
    std::vector<QDateTime> m_additions;
    size_t m_additionIndex = 0;
    std::set<QDateTime> m_exclusions;
    std::set<QDate> m_excludedDays;
    std::set<QDateTime> m_overriddenIds;
    std::vector<ResolvedInstance> m_overrides; // sorted by start
    size_t m_overrideIndex = 0;
    std::optional<QDateTime> m_pendingBase;
    bool m_baseDone = false;
};

} // namespace recurrence
} // namespace icalendar
