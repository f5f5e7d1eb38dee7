#include "icalendar/parser/ContentLine.hpp"

namespace icalendar {
namespace parser {

namespace {

bool isParameterDelimiter(QChar c)
{
    return c == QLatin1Char(',') || c == QLatin1Char(';') || c == QLatin1Char(':');
}

// RFC 6868: ^n is a newline, ^^ a caret and ^' a double quote.
QString decodeCaret(const QString &value)
{
    if (!value.contains(QLatin1Char('^'))) {
        return value;
    }
    QString decoded;
    decoded.reserve(value.size());
    for (int i = 0; i < value.size(); ++i) {
        const QChar c = value.at(i);
        if (c == QLatin1Char('^') && i + 1 < value.size()) {
            const QChar escaped = value.at(i + 1);
            if (escaped == QLatin1Char('n') || escaped == QLatin1Char('N')) {
                decoded += QLatin1Char('\n');
                ++i;
                continue;
            }
            if (escaped == QLatin1Char('^')) {
                decoded += QLatin1Char('^');
                ++i;
                continue;
            }
            if (escaped == QLatin1Char('\'')) {
                decoded += QLatin1Char('"');
                ++i;
                continue;
            }
        }
        decoded += c;
    }
    return decoded;
}

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

} // namespace

void Parameters::insert(const QString &name, const QStringList &values)
{
    const QString key = name.toUpper();
    for (auto &entry : m_entries) {
        if (entry.first == key) {
            entry.second << values;
            return;
        }
    }
    m_entries.emplace_back(key, values);
}

const QStringList *Parameters::find(const QString &name) const
{
    const QString key = name.toUpper();
    for (const auto &entry : m_entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

bool Parameters::contains(const QString &name) const
{
    return find(name) != nullptr;
}

bool Parameters::isEmpty() const
{
    return m_entries.empty();
}

int Parameters::size() const
{
    return static_cast<int>(m_entries.size());
}

QString Parameters::value(const QString &name, const QString &defaultValue) const
{
    const QStringList *values = find(name);
    if (!values || values->isEmpty()) {
        return defaultValue;
    }
    return values->front();
}

QStringList Parameters::values(const QString &name) const
{
    const QStringList *values = find(name);
    return values ? *values : QStringList();
}

QStringList Parameters::names() const
{
    QStringList names;
    for (const auto &entry : m_entries) {
        names << entry.first;
    }
    return names;
}

std::optional<ContentLine> ContentLineTokenizer::tokenize(const QString &line, int lineNumber, QString *error)
{
    const int length = line.size();
    int i = 0;
    while (i < length && line.at(i) != QLatin1Char(';') && line.at(i) != QLatin1Char(':')) {
        ++i;
    }

    ContentLine result;
    result.lineNumber = lineNumber;
    result.name = line.left(i).trimmed().toUpper();
    if (i == length) {
        setError(error, QStringLiteral("missing ':' separator"));
        return std::nullopt;
    }
    if (result.name.isEmpty()) {
        setError(error, QStringLiteral("empty property name"));
        return std::nullopt;
    }

    while (i < length && line.at(i) == QLatin1Char(';')) {
        ++i;
        const int nameStart = i;
        while (i < length && line.at(i) != QLatin1Char('=') && line.at(i) != QLatin1Char(';')
               && line.at(i) != QLatin1Char(':')) {
            ++i;
        }
        const QString parameterName = line.mid(nameStart, i - nameStart).trimmed();
        QStringList values;
        if (i < length && line.at(i) == QLatin1Char('=')) {
            ++i;
            for (;;) {
                QString value;
                if (i < length && line.at(i) == QLatin1Char('"')) {
                    const int close = line.indexOf(QLatin1Char('"'), i + 1);
                    if (close < 0) {
                        setError(error, QStringLiteral("unterminated quoted parameter value"));
                        return std::nullopt;
                    }
                    value = line.mid(i + 1, close - i - 1);
                    i = close + 1;
                }
                // Unquoted text, or junk trailing a quoted value, runs up to the next delimiter.
                while (i < length && !isParameterDelimiter(line.at(i))) {
                    value += line.at(i);
                    ++i;
                }
                values << decodeCaret(value);
                if (i < length && line.at(i) == QLatin1Char(',')) {
                    ++i;
                    continue;
                }
                break;
            }
        }
        if (!parameterName.isEmpty()) {
            result.parameters.insert(parameterName, values);
        }
    }

    if (i >= length || line.at(i) != QLatin1Char(':')) {
        setError(error, QStringLiteral("missing ':' separator"));
        return std::nullopt;
    }
    result.value = line.mid(i + 1);
    return result;
}

} // namespace parser
} // namespace icalendar
