#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include "version.h"

#include "icalendar/core/Settings.hpp"
#include "icalendar/io/CalendarReader.hpp"
#include "icalendar/model/Component.hpp"
#include "icalendar/timeline/Timeline.hpp"
#include "icalendar/zone/ZoneResolver.hpp"

namespace {

enum ExitCode
{
    ExitOk = 0,
    ExitReadError = 1,
    ExitUsage = 2,
};

std::optional<QDateTime> parseBound(const QString &text)
{
    QDateTime value = QDateTime::fromString(text, Qt::ISODate);
    if (!value.isValid()) {
        const QDate date = QDate::fromString(text, Qt::ISODate);
        if (!date.isValid()) {
            return std::nullopt;
        }
        value = QDateTime(date, QTime(0, 0), Qt::UTC);
    }
    if (value.timeSpec() == Qt::LocalTime) {
        value.setTimeSpec(Qt::UTC);
    }
    return value;
}

QString formatInstant(const QDateTime &instant, bool allDay)
{
    return allDay ? instant.date().toString(Qt::ISODate) : instant.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("icalendar"));
    QCoreApplication::setApplicationName(QStringLiteral("icaltimeline"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kIcalTimelineVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Prints the occurrences of calendar files within a window."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption fromOption(QStringLiteral("from"), QStringLiteral("Window start (ISO date or date-time, default today)."),
                                        QStringLiteral("date"));
    const QCommandLineOption toOption(QStringLiteral("to"), QStringLiteral("Window end, exclusive."), QStringLiteral("date"));
    const QCommandLineOption limitOption(QStringLiteral("limit"), QStringLiteral("Most occurrences to print."),
                                         QStringLiteral("n"));
    const QCommandLineOption zoneOption(QStringLiteral("zone"), QStringLiteral("Zone for floating times."),
                                        QStringLiteral("tz"));
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("INI file with timeline defaults."),
                                          QStringLiteral("file"));
    parser.addOption(fromOption);
    parser.addOption(toOption);
    parser.addOption(limitOption);
    parser.addOption(zoneOption);
    parser.addOption(configOption);
    parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("Calendar files to read."),
                                 QStringLiteral("FILE..."));
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty()) {
        err << "no calendar file given" << Qt::endl;
        return ExitUsage;
    }

    std::unique_ptr<QSettings> settingsStore = parser.isSet(configOption)
        ? std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat)
        : std::make_unique<QSettings>();
    icalendar::core::TimelineSettings settings = icalendar::core::TimelineSettings::load(*settingsStore);

    if (parser.isSet(zoneOption)) {
        settings.floatingZone = parser.value(zoneOption);
    }
    if (parser.isSet(limitOption)) {
        bool ok = false;
        const int limit = parser.value(limitOption).toInt(&ok);
        if (!ok || limit < 1) {
            err << "invalid --limit: " << parser.value(limitOption) << Qt::endl;
            return ExitUsage;
        }
        settings.maxOccurrences = limit;
    }

    std::optional<QDateTime> from = QDateTime(QDate::currentDate(), QTime(0, 0), Qt::UTC);
    if (parser.isSet(fromOption)) {
        from = parseBound(parser.value(fromOption));
        if (!from) {
            err << "invalid --from: " << parser.value(fromOption) << Qt::endl;
            return ExitUsage;
        }
    }
    std::optional<QDateTime> to = from->addDays(settings.windowDays);
    if (parser.isSet(toOption)) {
        to = parseBound(parser.value(toOption));
        if (!to) {
            err << "invalid --to: " << parser.value(toOption) << Qt::endl;
            return ExitUsage;
        }
    }

    int exitCode = ExitOk;
    std::vector<std::shared_ptr<const icalendar::model::Component>> components;
    for (const QString &file : files) {
        QString error;
        const auto result = icalendar::io::CalendarReader::readFile(file, &error);
        if (!result) {
            err << error << Qt::endl;
            exitCode = ExitReadError;
            continue;
        }
        for (const auto &diagnostic : result->diagnostics) {
            if (diagnostic.severity == icalendar::parser::Diagnostic::Severity::Warning) {
                err << file << ':' << diagnostic.line << ": " << diagnostic.message << Qt::endl;
            }
        }
        components.insert(components.end(), result->roots.cbegin(), result->roots.cend());
    }

    const icalendar::timeline::Timeline timeline(components, settings.toOptions(),
                                                 std::make_shared<icalendar::zone::SystemZoneResolver>());
    try {
        for (const auto &occurrence : timeline.query(from, to)) {
            out << formatInstant(occurrence.start, occurrence.allDay) << '\t'
                << formatInstant(occurrence.end, occurrence.allDay) << '\t' << occurrence.component->summary();
            if (occurrence.overridden) {
                out << "\t(moved)";
            }
            out << Qt::endl;
        }
    } catch (const std::invalid_argument &error) {
        err << error.what() << Qt::endl;
        return ExitUsage;
    }

    return exitCode;
}
