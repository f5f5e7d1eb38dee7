#include "icalendar/io/CalendarReader.hpp"

#include "icalendar/core/Logging.hpp"

#include <QFile>
#include <QFileInfo>
#include <QTextStream>

namespace icalendar {
namespace io {

namespace {
std::nullopt_t fail(const QString &reason, QString *error)
{
    qCWarning(lcIo).noquote() << reason;
    if (error) {
        *error = reason;
    }
    return std::nullopt;
}
} // namespace

std::optional<QString> CalendarReader::readText(const QString &filePath, QString *error)
{
    QFile file(filePath);
    if (!file.exists()) {
        return fail(QStringLiteral("%1: no such file").arg(filePath), error);
    }
    if (QFileInfo(filePath).isDir()) {
        return fail(QStringLiteral("%1: is a directory").arg(filePath), error);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(QStringLiteral("%1: %2").arg(filePath, file.errorString()), error);
    }
    qCDebug(lcIo) << "reading" << filePath << file.size() << "bytes";
    return readText(file, error);
}

std::optional<QString> CalendarReader::readText(QIODevice &device, QString *error)
{
    if (!device.isReadable()) {
        return fail(QStringLiteral("device is not open for reading"), error);
    }
    QTextStream stream(&device);
    stream.setCodec("UTF-8");
    QString text = stream.readAll();
    if (stream.status() != QTextStream::Ok) {
        return fail(QStringLiteral("read error: %1").arg(device.errorString()), error);
    }
    return text;
}

std::optional<parser::ParseResult> CalendarReader::readFile(const QString &filePath, QString *error)
{
    const auto text = readText(filePath, error);
    if (!text) {
        return std::nullopt;
    }
    return parser::CalendarParser::parse(*text);
}

} // namespace io
} // namespace icalendar
