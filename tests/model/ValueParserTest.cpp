#include <QtTest/QtTest>

#include "icalendar/model/ValueParser.hpp"

using namespace icalendar;

class ValueParserTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesDatesAndDateTimes();
    void rejectsMalformedDateTimes();
    void parsesDurations();
    void parsesPeriods();
    void parsesUtcOffsets();
    void splitsEscapedLists();
};

void ValueParserTest::parsesDatesAndDateTimes()
{
    const auto date = model::parseDateTime(QStringLiteral("20240229"));
    QVERIFY(date.has_value());
    QVERIFY(date->dateOnly);
    QCOMPARE(date->date, QDate(2024, 2, 29));
    QCOMPARE(date->wallClock(), QDateTime(QDate(2024, 2, 29), QTime(0, 0), Qt::UTC));

    const auto utc = model::parseDateTime(QStringLiteral("20240101T090000Z"), QStringLiteral("Europe/Vienna"));
    QVERIFY(utc.has_value());
    QVERIFY(utc->utc);
    QVERIFY(utc->tzid.isEmpty());
    QCOMPARE(utc->time, QTime(9, 0));

    const auto zoned = model::parseDateTime(QStringLiteral("20240101T093015"), QStringLiteral("Europe/Vienna"));
    QVERIFY(zoned.has_value());
    QCOMPARE(zoned->tzid, QStringLiteral("Europe/Vienna"));
    QVERIFY(!zoned->isFloating());

    const auto leap = model::parseDateTime(QStringLiteral("20161231T235960Z"));
    QVERIFY(leap.has_value());
    QCOMPARE(leap->time, QTime(23, 59, 59));
}

void ValueParserTest::rejectsMalformedDateTimes()
{
    QVERIFY(!model::parseDateTime(QStringLiteral("20230229")));
    QVERIFY(!model::parseDateTime(QStringLiteral("2024-01-01")));
    QVERIFY(!model::parseDateTime(QStringLiteral("20240101T2500")));
    QVERIFY(!model::parseDateTime(QStringLiteral("20240101T250000")));
    QVERIFY(!model::parseDateTime(QStringLiteral("20240101T090000X")));
    QVERIFY(!model::parseDateTime(QStringLiteral("20240101T090000"), QString(), true));
    QVERIFY(!model::parseDateTimeList(QStringLiteral("20240101,bogus")));
}

void ValueParserTest::parsesDurations()
{
    const auto week = model::parseDuration(QStringLiteral("P1W"));
    QVERIFY(week.has_value());
    QCOMPARE(week->totalSeconds(), qint64(7 * 86400));

    const auto mixed = model::parseDuration(QStringLiteral("-P1DT2H3M4S"));
    QVERIFY(mixed.has_value());
    QVERIFY(mixed->negative);
    QCOMPARE(mixed->totalSeconds(), -qint64(86400 + 2 * 3600 + 3 * 60 + 4));

    QVERIFY(!model::parseDuration(QStringLiteral("P")));
    QVERIFY(!model::parseDuration(QStringLiteral("PT")));
    QVERIFY(!model::parseDuration(QStringLiteral("P1H")));
    QVERIFY(!model::parseDuration(QStringLiteral("PT1D")));
    QVERIFY(!model::parseDuration(QStringLiteral("1D")));
}

void ValueParserTest::parsesPeriods()
{
    const auto explicitEnd = model::parsePeriod(QStringLiteral("19970101T180000Z/19970102T070000Z"));
    QVERIFY(explicitEnd.has_value());
    QCOMPARE(explicitEnd->end.date, QDate(1997, 1, 2));
    QVERIFY(!explicitEnd->duration);

    const auto withDuration = model::parsePeriod(QStringLiteral("19970101T180000Z/PT5H30M"));
    QVERIFY(withDuration.has_value());
    QVERIFY(withDuration->duration.has_value());
    QCOMPARE(withDuration->duration->totalSeconds(), qint64(5 * 3600 + 30 * 60));
    QVERIFY(!withDuration->end.isValid());

    QVERIFY(!model::parsePeriod(QStringLiteral("19970101/19970102")));
    QVERIFY(!model::parsePeriod(QStringLiteral("19970101T180000Z")));
}

void ValueParserTest::parsesUtcOffsets()
{
    QCOMPARE(model::parseUtcOffset(QStringLiteral("+0100"))->seconds, 3600);
    QCOMPARE(model::parseUtcOffset(QStringLiteral("-053000"))->seconds, -(5 * 3600 + 30 * 60));
    QVERIFY(!model::parseUtcOffset(QStringLiteral("0100")));
    QVERIFY(!model::parseUtcOffset(QStringLiteral("+2500")));
}

void ValueParserTest::splitsEscapedLists()
{
    QCOMPARE(model::splitEscapedList(QStringLiteral("a\\,b,c\\;d,e\\nf")),
             QStringList({ QStringLiteral("a,b"), QStringLiteral("c;d"), QStringLiteral("e\nf") }));
    QCOMPARE(model::unescapeText(QStringLiteral("back\\\\slash")), QStringLiteral("back\\slash"));
}

QTEST_GUILESS_MAIN(ValueParserTest)
#include "ValueParserTest.moc"
