#include <QtTest/QtTest>

#include "icalendar/model/Component.hpp"
#include "icalendar/model/Property.hpp"
#include "icalendar/parser/CalendarParser.hpp"

using namespace icalendar;

namespace {
model::Property makeProperty(const QString &line)
{
    auto content = parser::ContentLineTokenizer::tokenize(line, 1);
    return model::Property(content->name, content->parameters, content->value, content->lineNumber);
}
} // namespace

class PropertyTest : public QObject
{
    Q_OBJECT

private slots:
    void convertsLazilyAndCaches();
    void cachesConversionFailures();
    void keepsRawValueOnFailure();
    void honoursValueParameter();
    void exposesDateListsAndPeriods();
    void componentTypedValueLookup();
};

void PropertyTest::convertsLazilyAndCaches()
{
    const model::Property property = makeProperty(QStringLiteral("DTSTART;TZID=Europe/Vienna:20240101T090000"));
    QVERIFY(!property.isConverted());

    const model::PropertyValue &first = property.typedValue();
    QVERIFY(property.isConverted());
    const model::PropertyValue &second = property.typedValue();
    QCOMPARE(&first, &second);

    const model::DateTimeValue value = property.dateTime();
    QCOMPARE(value.date, QDate(2024, 1, 1));
    QCOMPARE(value.time, QTime(9, 0));
    QCOMPARE(value.tzid, QStringLiteral("Europe/Vienna"));
}

void PropertyTest::cachesConversionFailures()
{
    const model::Property property = makeProperty(QStringLiteral("PRIORITY:high"));
    QVERIFY_EXCEPTION_THROWN(property.integer(), model::ConversionError);
    QVERIFY(property.isConverted());
    QVERIFY_EXCEPTION_THROWN(property.typedValue(), model::ConversionError);
}

void PropertyTest::keepsRawValueOnFailure()
{
    const model::Property property = makeProperty(QStringLiteral("DTEND:2024-01-01"));
    try {
        property.dateTime();
        QFAIL("expected a conversion error");
    } catch (const model::ConversionError &error) {
        QCOMPARE(error.propertyName(), QStringLiteral("DTEND"));
        QCOMPARE(error.rawValue(), QStringLiteral("2024-01-01"));
    }
    QCOMPARE(property.rawValue(), QStringLiteral("2024-01-01"));

    // Asking for the wrong type is a conversion error as well.
    const model::Property summary = makeProperty(QStringLiteral("SUMMARY:Lunch"));
    QCOMPARE(summary.text(), QStringLiteral("Lunch"));
    QVERIFY_EXCEPTION_THROWN(summary.duration(), model::ConversionError);
}

void PropertyTest::honoursValueParameter()
{
    const model::Property date = makeProperty(QStringLiteral("DTSTART;VALUE=DATE:20240105"));
    QVERIFY(date.valueType() == model::ValueType::DateTime);
    QVERIFY(date.dateTime().dateOnly);

    const model::Property rejected = makeProperty(QStringLiteral("DTSTART;VALUE=DATE:20240105T100000"));
    QVERIFY_EXCEPTION_THROWN(rejected.dateTime(), model::ConversionError);

    const model::Property flag = makeProperty(QStringLiteral("X-FLAG;VALUE=BOOLEAN:TRUE"));
    QVERIFY(flag.valueType() == model::ValueType::Boolean);
    QVERIFY(std::get<bool>(flag.typedValue()));

    const model::Property geo = makeProperty(QStringLiteral("GEO:48.2;16.37"));
    QCOMPARE(geo.floats(), QList<double>({ 48.2, 16.37 }));

    const model::Property categories = makeProperty(QStringLiteral("CATEGORIES:WORK,MEETING\\, WEEKLY"));
    QCOMPARE(categories.textList(), QStringList({ QStringLiteral("WORK"), QStringLiteral("MEETING, WEEKLY") }));
}

void PropertyTest::exposesDateListsAndPeriods()
{
    const model::Property exdate = makeProperty(QStringLiteral("EXDATE:20240102T090000Z,20240104T090000Z"));
    const QList<model::DateTimeValue> dates = exdate.dateTimes();
    QCOMPARE(dates.size(), 2);
    QVERIFY(dates.at(1).utc);
    QCOMPARE(dates.at(1).date, QDate(2024, 1, 4));

    const model::Property rdate = makeProperty(QStringLiteral("RDATE;VALUE=PERIOD:20240110T100000Z/PT1H"));
    QCOMPARE(rdate.periods().size(), 1);
    QCOMPARE(rdate.dateTimes().front().time, QTime(10, 0));

    const model::Property rule = makeProperty(QStringLiteral("RRULE:FREQ=WEEKLY;COUNT=4"));
    QVERIFY(rule.recurrenceRule().frequency == recurrence::Frequency::Weekly);
    QCOMPARE(*rule.recurrenceRule().count, 4);
}

void PropertyTest::componentTypedValueLookup()
{
    const parser::ParseResult result = parser::CalendarParser::parse(QStringLiteral(
        "BEGIN:VEVENT\n"
        "UID:x\n"
        "ATTENDEE:mailto:a@example.com\n"
        "ATTENDEE:mailto:b@example.com\n"
        "SEQUENCE:3\n"
        "END:VEVENT\n"));
    const auto event = result.root();
    QCOMPARE(event->propertiesNamed(QStringLiteral("attendee")).size(), static_cast<size_t>(2));
    QCOMPARE(event->property(QStringLiteral("ATTENDEE"), 1)->rawValue(), QStringLiteral("mailto:b@example.com"));
    QVERIFY(event->typedValue(QStringLiteral("DTSTART")) == nullptr);

    const model::PropertyValue *sequence = event->typedValue(QStringLiteral("SEQUENCE"));
    QVERIFY(sequence);
    QCOMPARE(std::get<int>(*sequence), 3);
    QCOMPARE(event->typedValue(QStringLiteral("SEQUENCE")), sequence);
}

QTEST_GUILESS_MAIN(PropertyTest)
#include "PropertyTest.moc"
