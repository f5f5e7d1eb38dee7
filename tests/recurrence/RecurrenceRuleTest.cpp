#include <QtTest/QtTest>

#include "icalendar/recurrence/RecurrenceRule.hpp"

using namespace icalendar;
using recurrence::RecurrenceRule;

class RecurrenceRuleTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesAllParts();
    void isCaseInsensitiveAndIgnoresUnknownParts();
    void rejectsSyntaxErrors();
    void flagsInconsistentDefinitions();
};

void RecurrenceRuleTest::parsesAllParts()
{
    QString error;
    const auto rule = RecurrenceRule::fromString(
        QStringLiteral("FREQ=MONTHLY;INTERVAL=2;UNTIL=20241231T235959Z;BYDAY=1MO,-1FR,WE;BYMONTH=1,6;"
                       "BYSETPOS=-1;BYHOUR=9;BYMINUTE=30;BYSECOND=0;WKST=SU"),
        &error);
    QVERIFY2(rule.has_value(), qPrintable(error));
    QVERIFY(rule->frequency == recurrence::Frequency::Monthly);
    QCOMPARE(rule->interval, 2);
    QVERIFY(!rule->count);
    QVERIFY(rule->until.has_value());
    QVERIFY(rule->until->utc);
    QCOMPARE(rule->until->date, QDate(2024, 12, 31));
    QCOMPARE(rule->byDay.size(), 3);
    QVERIFY(rule->byDay.at(0) == (recurrence::WeekdayNum { 1, Qt::Monday }));
    QVERIFY(rule->byDay.at(1) == (recurrence::WeekdayNum { -1, Qt::Friday }));
    QVERIFY(rule->byDay.at(2) == (recurrence::WeekdayNum { 0, Qt::Wednesday }));
    QCOMPARE(rule->byMonth, QList<int>({ 1, 6 }));
    QCOMPARE(rule->bySetPos, QList<int>({ -1 }));
    QCOMPARE(rule->byHour, QList<int>({ 9 }));
    QCOMPARE(rule->weekStart, Qt::Sunday);
    QVERIFY(rule->isValid());
}

void RecurrenceRuleTest::isCaseInsensitiveAndIgnoresUnknownParts()
{
    const auto rule = RecurrenceRule::fromString(QStringLiteral("freq=weekly;count=4;x-name=foo;byday=tu"));
    QVERIFY(rule.has_value());
    QVERIFY(rule->frequency == recurrence::Frequency::Weekly);
    QCOMPARE(*rule->count, 4);
    QCOMPARE(rule->byDay.size(), 1);
    QCOMPARE(rule->byDay.front().day, Qt::Tuesday);
}

void RecurrenceRuleTest::rejectsSyntaxErrors()
{
    QString error;
    QVERIFY(!RecurrenceRule::fromString(QStringLiteral("COUNT=3"), &error));
    QCOMPARE(error, QStringLiteral("rule has no FREQ"));
    QVERIFY(!RecurrenceRule::fromString(QStringLiteral("FREQ=FORTNIGHTLY"), &error));
    QVERIFY(!RecurrenceRule::fromString(QStringLiteral("FREQ=DAILY;COUNT=three"), &error));
    QVERIFY(!RecurrenceRule::fromString(QStringLiteral("FREQ=DAILY;BYDAY=XX"), &error));
    QVERIFY(!RecurrenceRule::fromString(QStringLiteral("FREQ=DAILY;BYHOUR"), &error));
}

void RecurrenceRuleTest::flagsInconsistentDefinitions()
{
    auto definitionError = [](const char *text) {
        return RecurrenceRule::fromString(QString::fromLatin1(text))->definitionError();
    };
    QVERIFY(!definitionError("FREQ=DAILY;COUNT=2;UNTIL=20240101").isEmpty());
    QVERIFY(!definitionError("FREQ=DAILY;INTERVAL=0").isEmpty());
    QVERIFY(!definitionError("FREQ=YEARLY;BYMONTH=13").isEmpty());
    QVERIFY(!definitionError("FREQ=MONTHLY;BYMONTHDAY=0").isEmpty());
    QVERIFY(!definitionError("FREQ=MONTHLY;BYWEEKNO=3").isEmpty());
    QVERIFY(!definitionError("FREQ=WEEKLY;BYMONTHDAY=3").isEmpty());
    QVERIFY(!definitionError("FREQ=DAILY;BYYEARDAY=100").isEmpty());
    QVERIFY(definitionError("FREQ=YEARLY;BYYEARDAY=-1").isEmpty());
    QVERIFY(definitionError("FREQ=MONTHLY;BYMONTHDAY=-31").isEmpty());
}

QTEST_GUILESS_MAIN(RecurrenceRuleTest)
#include "RecurrenceRuleTest.moc"
