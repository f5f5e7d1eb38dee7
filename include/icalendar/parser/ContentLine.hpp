#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include <utility>
#include <vector>

namespace icalendar {
namespace parser {

// Ordered parameter map. Names are case-insensitive and stored upper-cased;
// a parameter may carry several comma-separated values.
class Parameters
{
public:
    void insert(const QString &name, const QStringList &values);

    bool contains(const QString &name) const;
    bool isEmpty() const;
    int size() const;

    QString value(const QString &name, const QString &defaultValue = QString()) const;
    QStringList values(const QString &name) const;
    QStringList names() const;

private:
    const QStringList *find(const QString &name) const;

    std::vector<std::pair<QString, QStringList>> m_entries;
};

struct ContentLine
{
    QString name;
    Parameters parameters;
    QString value;
    int lineNumber = 0;
};

class ContentLineTokenizer
{
public:
    // Splits "NAME;PARAM=V1,V2;...:VALUE". Returns std::nullopt and fills
    // *error when the line has no value separator or no name.
    static std::optional<ContentLine> tokenize(const QString &line, int lineNumber = 0, QString *error = nullptr);
};

} // namespace parser
} // namespace icalendar
