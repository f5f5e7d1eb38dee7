#include "icalendar/parser/LineUnfolder.hpp"

namespace icalendar {
namespace parser {

namespace {
constexpr QChar ByteOrderMark(0xFEFF);

bool isFoldWhitespace(QChar c)
{
    return c == QLatin1Char(' ') || c == QLatin1Char('\t');
}
} // namespace

LineUnfolder::LineUnfolder(QString text)
    : m_text(std::move(text))
{
    if (m_text.startsWith(ByteOrderMark)) {
        m_pos = 1;
    }
}

bool LineUnfolder::atEnd() const
{
    return m_pos >= m_text.size();
}

bool LineUnfolder::readPhysical(QString *line)
{
    if (atEnd()) {
        return false;
    }
    int end = m_text.indexOf(QLatin1Char('\n'), m_pos);
    if (end < 0) {
        end = m_text.size();
    }
    *line = m_text.mid(m_pos, end - m_pos);
    if (line->endsWith(QLatin1Char('\r'))) {
        line->chop(1);
    }
    m_pos = end + 1;
    ++m_lineNumber;
    return true;
}

bool LineUnfolder::continuationFollows() const
{
    return !atEnd() && isFoldWhitespace(m_text.at(m_pos));
}

std::optional<LogicalLine> LineUnfolder::next()
{
    QString physical;
    while (readPhysical(&physical)) {
        if (physical.isEmpty()) {
            continue;
        }
        LogicalLine logical;
        logical.lineNumber = m_lineNumber;
        // A stray continuation without a preceding line starts a line of its own.
        logical.text = isFoldWhitespace(physical.front()) ? physical.mid(1) : physical;
        while (continuationFollows() && readPhysical(&physical)) {
            logical.text += physical.mid(1);
        }
        return logical;
    }
    return std::nullopt;
}

QStringList LineUnfolder::unfold(const QString &text)
{
    QStringList lines;
    LineUnfolder unfolder(text);
    while (auto line = unfolder.next()) {
        lines << line->text;
    }
    return lines;
}

} // namespace parser
} // namespace icalendar
