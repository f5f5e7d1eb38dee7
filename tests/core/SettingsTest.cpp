#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "icalendar/core/Settings.hpp"

using namespace icalendar;

class SettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void readsAndClampsValues();
    void savesRoundTrip();
};

void SettingsTest::defaultsWhenEmpty()
{
    QTemporaryDir dir;
    QSettings store(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);
    const core::TimelineSettings settings = core::TimelineSettings::load(store);
    QVERIFY(!settings.floatingZone);
    QCOMPARE(settings.windowDays, core::TimelineSettings::DefaultWindowDays);
    QCOMPARE(settings.maxOccurrences, 10000);
}

void SettingsTest::readsAndClampsValues()
{
    QTemporaryDir dir;
    QSettings store(dir.filePath(QStringLiteral("timeline.ini")), QSettings::IniFormat);
    store.setValue(QStringLiteral("timeline/floatingZone"), QStringLiteral(" Europe/Vienna "));
    store.setValue(QStringLiteral("timeline/windowDays"), 0);
    store.setValue(QStringLiteral("timeline/maxOccurrences"), QStringLiteral("many"));

    const core::TimelineSettings settings = core::TimelineSettings::load(store);
    QCOMPARE(settings.floatingZone.value_or(QString()), QStringLiteral("Europe/Vienna"));
    QCOMPARE(settings.windowDays, 1);
    QCOMPARE(settings.maxOccurrences, 10000);

    const timeline::TimelineOptions options = settings.toOptions();
    QCOMPARE(options.floatingZone.value_or(QString()), QStringLiteral("Europe/Vienna"));
}

void SettingsTest::savesRoundTrip()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("saved.ini"));
    core::TimelineSettings settings;
    settings.windowDays = 7;
    settings.maxOccurrences = 250;
    {
        QSettings store(path, QSettings::IniFormat);
        settings.save(store);
    }
    QSettings reread(path, QSettings::IniFormat);
    const core::TimelineSettings loaded = core::TimelineSettings::load(reread);
    QCOMPARE(loaded.windowDays, 7);
    QCOMPARE(loaded.maxOccurrences, 250);
    QVERIFY(!loaded.floatingZone);
}

QTEST_GUILESS_MAIN(SettingsTest)
#include "SettingsTest.moc"
