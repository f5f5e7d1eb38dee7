#pragma once

#include <QString>
#include <optional>

#include "icalendar/parser/CalendarParser.hpp"

class QIODevice;

namespace icalendar {
namespace io {

// Reads calendar documents (UTF-8) from disk or an open device and hands the
// text to the parser. Failures come back as an empty optional; error, when
// given, receives the reason.
class CalendarReader
{
public:
    static std::optional<QString> readText(const QString &filePath, QString *error = nullptr);
    static std::optional<QString> readText(QIODevice &device, QString *error = nullptr);

    static std::optional<parser::ParseResult> readFile(const QString &filePath, QString *error = nullptr);
};

} // namespace io
} // namespace icalendar
