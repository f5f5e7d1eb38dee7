#include <QtTest/QtTest>

#include "icalendar/model/Component.hpp"
#include "icalendar/parser/CalendarParser.hpp"
#include "icalendar/recurrence/RecurrenceSet.hpp"
#include "icalendar/zone/TimeFrame.hpp"

using namespace icalendar;
using recurrence::RecurrenceRule;
using recurrence::RecurrenceSet;

namespace {
QDateTime at(int year, int month, int day, int hour = 9, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

RecurrenceRule rule(const char *text)
{
    return *RecurrenceRule::fromString(QString::fromLatin1(text));
}

std::vector<QDateTime> starts(const std::vector<recurrence::ResolvedInstance> &instances)
{
    std::vector<QDateTime> result;
    for (const auto &instance : instances) {
        result.push_back(instance.start);
    }
    return result;
}

std::shared_ptr<const model::Component> parseComponent(const QString &text)
{
    return parser::CalendarParser::parse(text).root();
}
} // namespace

class RecurrenceSetTest : public QObject
{
    Q_OBJECT

private slots:
    void exdateRemovesInstance();
    void unionOfRulesAndDatesCollapsesTies();
    void exclusionRuleRemovesInstances();
    void overrideReplacesInstance();
    void detachedOverrideIsKept();
    void windowIsHalfOpen();
    void iteratesInfiniteSeriesLazily();
    void buildsFromComponent();
    void dateOnlyExdateExcludesWholeDay();
    void skipsUnconvertibleRules();
};

void RecurrenceSetTest::exdateRemovesInstance()
{
    RecurrenceSet set(at(2024, 1, 1));
    set.addRule(rule("FREQ=DAILY;COUNT=5"));
    set.excludeDate(at(2024, 1, 3));

    const auto instances = set.resolve(std::nullopt, std::nullopt);
    QCOMPARE(starts(instances),
             std::vector<QDateTime>({ at(2024, 1, 1), at(2024, 1, 2), at(2024, 1, 4), at(2024, 1, 5) }));
    QVERIFY(set.isFinite());
}

void RecurrenceSetTest::unionOfRulesAndDatesCollapsesTies()
{
    RecurrenceSet set(at(2024, 1, 1));
    set.addRule(rule("FREQ=DAILY;COUNT=3"));
    set.addRule(rule("FREQ=DAILY;INTERVAL=2;COUNT=3"));
    set.addDate(at(2024, 1, 2));
    set.addDate(at(2024, 1, 10, 12));

    QCOMPARE(starts(set.resolve(std::nullopt, std::nullopt)),
             std::vector<QDateTime>({ at(2024, 1, 1), at(2024, 1, 2), at(2024, 1, 3), at(2024, 1, 5),
                                      at(2024, 1, 10, 12) }));
}

void RecurrenceSetTest::exclusionRuleRemovesInstances()
{
    RecurrenceSet set(at(2024, 1, 1));
    set.addRule(rule("FREQ=DAILY;COUNT=7"));
    set.addExclusionRule(rule("FREQ=DAILY;INTERVAL=2"));

    QCOMPARE(starts(set.resolve(std::nullopt, std::nullopt)),
             std::vector<QDateTime>({ at(2024, 1, 2), at(2024, 1, 4), at(2024, 1, 6) }));
}

void RecurrenceSetTest::overrideReplacesInstance()
{
    RecurrenceSet set(at(2024, 1, 1));
    set.addRule(rule("FREQ=DAILY;COUNT=5"));
    auto moved = std::make_shared<model::Component>(QStringLiteral("VEVENT"));
    set.addOverride(at(2024, 1, 3), at(2024, 1, 3, 15), moved);

    const auto instances = set.resolve(std::nullopt, std::nullopt);
    QCOMPARE(instances.size(), static_cast<size_t>(5));
    QCOMPARE(instances[2].start, at(2024, 1, 3, 15));
    QCOMPARE(instances[2].recurrenceId, at(2024, 1, 3));
    QVERIFY(instances[2].overridden);
    QVERIFY(instances[2].override == moved);
    for (size_t i : { 0, 1, 3, 4 }) {
        QVERIFY(!instances[i].overridden);
        QCOMPARE(instances[i].start, instances[i].recurrenceId);
    }
}

void RecurrenceSetTest::detachedOverrideIsKept()
{
    RecurrenceSet set(at(2024, 1, 1));
    set.addRule(rule("FREQ=DAILY;COUNT=2"));
    set.excludeDate(at(2024, 1, 2));
    set.addOverride(at(2024, 1, 2), at(2024, 1, 2, 11), nullptr);
    set.addOverride(at(2024, 2, 1), at(2024, 2, 1), nullptr);

    const auto instances = set.resolve(std::nullopt, std::nullopt);
    QCOMPARE(starts(instances), std::vector<QDateTime>({ at(2024, 1, 1), at(2024, 1, 2, 11), at(2024, 2, 1) }));
    QVERIFY(instances[1].overridden);
    QVERIFY(instances[2].overridden);
}

void RecurrenceSetTest::windowIsHalfOpen()
{
    RecurrenceSet set(at(2024, 1, 1));
    set.addRule(rule("FREQ=DAILY;COUNT=5"));
    QCOMPARE(starts(set.resolve(at(2024, 1, 2), at(2024, 1, 4))),
             std::vector<QDateTime>({ at(2024, 1, 2), at(2024, 1, 3) }));
    // The limit only bounds open-ended windows.
    QCOMPARE(set.resolve(at(2024, 1, 2), at(2024, 1, 5), 2).size(), static_cast<size_t>(3));
    QCOMPARE(set.resolve(at(2024, 1, 2), std::nullopt, 2).size(), static_cast<size_t>(2));
}

void RecurrenceSetTest::iteratesInfiniteSeriesLazily()
{
    RecurrenceSet set(at(2024, 1, 1));
    set.addRule(rule("FREQ=WEEKLY"));
    QVERIFY(!set.isFinite());

    recurrence::RecurrenceSetIterator iterator = set.iterate(at(2030, 1, 1));
    const auto first = iterator.next();
    QVERIFY(first.has_value());
    QCOMPARE(first->start, at(2030, 1, 7));
    QCOMPARE(iterator.next()->start, at(2030, 1, 14));
}

void RecurrenceSetTest::buildsFromComponent()
{
    const auto event = parseComponent(QStringLiteral(
        "BEGIN:VEVENT\n"
        "UID:series\n"
        "DTSTART:20240101T090000\n"
        "RRULE:FREQ=DAILY;COUNT=5\n"
        "EXDATE:20240103T090000\n"
        "RDATE:20240110T090000,20240101T090000\n"
        "END:VEVENT\n"));
    auto moved = parseComponent(QStringLiteral(
        "BEGIN:VEVENT\n"
        "UID:series\n"
        "RECURRENCE-ID:20240104T090000\n"
        "DTSTART:20240104T170000\n"
        "END:VEVENT\n"));

    const RecurrenceSet set = RecurrenceSet::fromComponent(*event, { moved }, zone::TimeFrame::floating(), nullptr);
    QCOMPARE(set.start(), at(2024, 1, 1));
    QVERIFY(set.isRecurring());

    const auto instances = set.resolve(std::nullopt, std::nullopt);
    QCOMPARE(starts(instances), std::vector<QDateTime>({ at(2024, 1, 1), at(2024, 1, 2), at(2024, 1, 4, 17),
                                                         at(2024, 1, 5), at(2024, 1, 10) }));
    QVERIFY(instances[2].override == moved);
}

void RecurrenceSetTest::dateOnlyExdateExcludesWholeDay()
{
    const auto event = parseComponent(QStringLiteral(
        "BEGIN:VEVENT\n"
        "DTSTART:20240101T090000\n"
        "RRULE:FREQ=HOURLY;INTERVAL=6;COUNT=8\n"
        "EXDATE;VALUE=DATE:20240101\n"
        "END:VEVENT\n"));
    const RecurrenceSet set = RecurrenceSet::fromComponent(*event, {}, zone::TimeFrame::floating(), nullptr);
    QCOMPARE(starts(set.resolve(std::nullopt, std::nullopt)),
             std::vector<QDateTime>({ at(2024, 1, 2, 3), at(2024, 1, 2, 9), at(2024, 1, 2, 15), at(2024, 1, 2, 21),
                                      at(2024, 1, 3, 3) }));
}

void RecurrenceSetTest::skipsUnconvertibleRules()
{
    const auto event = parseComponent(QStringLiteral(
        "BEGIN:VEVENT\n"
        "DTSTART:20240101T090000\n"
        "RRULE:COUNT=3\n"
        "RDATE:not-a-date\n"
        "END:VEVENT\n"));
    const RecurrenceSet set = RecurrenceSet::fromComponent(*event, {}, zone::TimeFrame::floating(), nullptr);
    QCOMPARE(starts(set.resolve(std::nullopt, std::nullopt)), std::vector<QDateTime>({ at(2024, 1, 1) }));
}

QTEST_GUILESS_MAIN(RecurrenceSetTest)
#include "RecurrenceSetTest.moc"
