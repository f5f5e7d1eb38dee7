#pragma once

#include <QString>
#include <QStringList>
#include <optional>

namespace icalendar {
namespace parser {

struct LogicalLine
{
    QString text;
    int lineNumber = 0; // 1-based physical line where the logical line starts
};

// Pulls unfolded content lines out of raw calendar text, one at a time.
// A physical line starting with a single space or tab continues the previous
// one; that first whitespace character is dropped.
class LineUnfolder
{
public:
    explicit LineUnfolder(QString text);

    bool atEnd() const;
    std::optional<LogicalLine> next();

    static QStringList unfold(const QString &text);

private:
    bool readPhysical(QString *line);
    bool continuationFollows() const;

    QString m_text;
    int m_pos = 0;
    int m_lineNumber = 0;
};

} // namespace parser
} // namespace icalendar
