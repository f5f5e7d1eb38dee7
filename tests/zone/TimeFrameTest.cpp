#include <QtTest/QtTest>

#include "icalendar/model/ValueParser.hpp"
#include "icalendar/zone/TimeFrame.hpp"
#include "icalendar/zone/ZoneResolver.hpp"

using namespace icalendar;
using zone::TimeFrame;

namespace {
QDateTime wall(int year, int month, int day, int hour, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}
} // namespace

class TimeFrameTest : public QObject
{
    Q_OBJECT

private slots:
    void classifiesValues();
    void convertsBetweenWallClockAndInstant();
    void readsValuesOfOtherFrames();
    void unknownZoneIsUnresolvable();
    void systemResolverKnowsUtc();
};

void TimeFrameTest::classifiesValues()
{
    QVERIFY(TimeFrame::of(*model::parseDateTime(QStringLiteral("20240101T090000"))).kind()
            == TimeFrame::Kind::Floating);
    QVERIFY(TimeFrame::of(*model::parseDateTime(QStringLiteral("20240101T090000Z"))).kind() == TimeFrame::Kind::Utc);
    const TimeFrame zoned = TimeFrame::of(*model::parseDateTime(QStringLiteral("20240101T090000"), QStringLiteral("X/Y")));
    QVERIFY(zoned == TimeFrame::zoned(QStringLiteral("X/Y")));
    QCOMPARE(zoned.zoneId(), QStringLiteral("X/Y"));
}

void TimeFrameTest::convertsBetweenWallClockAndInstant()
{
    zone::FixedOffsetZoneResolver resolver;
    resolver.setOffset(QStringLiteral("Test/Plus2"), 2 * 3600);
    const TimeFrame frame = TimeFrame::zoned(QStringLiteral("Test/Plus2"));

    QCOMPARE(frame.toInstant(wall(2024, 1, 1, 9), &resolver), wall(2024, 1, 1, 7));
    QCOMPARE(frame.fromInstant(wall(2024, 1, 1, 23), &resolver), wall(2024, 1, 2, 1));
    QCOMPARE(TimeFrame::floating().toInstant(wall(2024, 1, 1, 9), &resolver), wall(2024, 1, 1, 9));
    QCOMPARE(TimeFrame::utc().fromInstant(wall(2024, 1, 1, 9), &resolver), wall(2024, 1, 1, 9));
}

void TimeFrameTest::readsValuesOfOtherFrames()
{
    zone::FixedOffsetZoneResolver resolver;
    resolver.setOffset(QStringLiteral("Test/Minus5"), -5 * 3600);
    const TimeFrame frame = TimeFrame::zoned(QStringLiteral("Test/Minus5"));

    const auto utcValue = model::parseDateTime(QStringLiteral("20240101T120000Z"));
    QCOMPARE(frame.wallClockOf(*utcValue, &resolver), wall(2024, 1, 1, 7));

    const auto floatingValue = model::parseDateTime(QStringLiteral("20240101T120000"));
    QCOMPARE(frame.wallClockOf(*floatingValue, &resolver), wall(2024, 1, 1, 12));

    const auto day = model::parseDateTime(QStringLiteral("20240101"));
    QCOMPARE(TimeFrame::utc().wallClockOf(*day, &resolver), wall(2024, 1, 1, 0));
}

void TimeFrameTest::unknownZoneIsUnresolvable()
{
    zone::FixedOffsetZoneResolver resolver;
    const TimeFrame frame = TimeFrame::zoned(QStringLiteral("Nowhere/Special"));
    QVERIFY(!frame.isResolvable(&resolver, wall(2024, 1, 1, 0)));
    QVERIFY(TimeFrame::floating().isResolvable(&resolver, wall(2024, 1, 1, 0)));
    // Unresolvable frames leave wall clocks untouched.
    QCOMPARE(frame.toInstant(wall(2024, 1, 1, 9), &resolver), wall(2024, 1, 1, 9));
}

void TimeFrameTest::systemResolverKnowsUtc()
{
    zone::SystemZoneResolver resolver;
    QCOMPARE(resolver.utcOffset(QStringLiteral("UTC"), wall(2024, 6, 1, 12)), std::optional<int>(0));
    QVERIFY(!resolver.utcOffset(QStringLiteral("Not/AZone"), wall(2024, 6, 1, 12)));
}

QTEST_GUILESS_MAIN(TimeFrameTest)
#include "TimeFrameTest.moc"
