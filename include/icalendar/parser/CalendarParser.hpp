#pragma once

#include <QString>
#include <memory>
#include <vector>

#include "icalendar/model/Component.hpp"

namespace icalendar {
namespace parser {

struct Diagnostic
{
    enum class Severity
    {
        Info,
        Warning,
    };

    Severity severity = Severity::Warning;
    int line = 0;
    QString message;
};

struct ParseResult
{
    // Top-level components in file order; never empty.
    std::vector<std::shared_ptr<const model::Component>> roots;
    std::vector<Diagnostic> diagnostics;

    std::shared_ptr<const model::Component> root() const;
    bool hasWarnings() const;
};

// Builds the component tree from calendar text. Never throws on malformed
// input: bad lines and broken nesting are reported as diagnostics and the
// parser carries on with what it has.
class CalendarParser
{
public:
    static ParseResult parse(const QString &text);
};

} // namespace parser
} // namespace icalendar
