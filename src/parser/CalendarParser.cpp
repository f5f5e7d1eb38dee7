#include "icalendar/parser/CalendarParser.hpp"

#include "icalendar/core/Logging.hpp"
#include "icalendar/parser/ContentLine.hpp"
#include "icalendar/parser/LineUnfolder.hpp"

namespace icalendar {
namespace parser {

using model::Component;

std::shared_ptr<const model::Component> ParseResult::root() const
{
    return roots.empty() ? nullptr : roots.front();
}

bool ParseResult::hasWarnings() const
{
    for (const Diagnostic &diagnostic : diagnostics) {
        if (diagnostic.severity == Diagnostic::Severity::Warning) {
            return true;
        }
    }
    return false;
}

ParseResult CalendarParser::parse(const QString &text)
{
    ParseResult result;
    std::vector<std::shared_ptr<Component>> stack;

    auto report = [&result](Diagnostic::Severity severity, int line, const QString &message) {
        if (severity == Diagnostic::Severity::Warning) {
            qCWarning(lcParser).noquote() << "line" << line << message;
        } else {
            qCDebug(lcParser).noquote() << "line" << line << message;
        }
        result.diagnostics.push_back({ severity, line, message });
    };

    LineUnfolder unfolder(text);
    while (auto line = unfolder.next()) {
        QString error;
        auto content = ContentLineTokenizer::tokenize(line->text, line->lineNumber, &error);
        if (!content) {
            report(Diagnostic::Severity::Warning, line->lineNumber, QStringLiteral("skipping malformed line: %1").arg(error));
            continue;
        }

        if (content->name == QLatin1String("BEGIN")) {
            const QString typeName = content->value.trimmed();
            if (typeName.isEmpty()) {
                report(Diagnostic::Severity::Warning, line->lineNumber, QStringLiteral("BEGIN without component name"));
                continue;
            }
            auto component = std::make_shared<Component>(typeName);
            if (component->type() == model::ComponentType::Unrecognized) {
                report(Diagnostic::Severity::Info, line->lineNumber,
                       QStringLiteral("keeping unrecognized component %1").arg(component->typeName()));
            }
            if (stack.empty()) {
                result.roots.push_back(component);
            } else {
                Component::appendChild(stack.back(), component);
            }
            stack.push_back(std::move(component));
            continue;
        }

        if (content->name == QLatin1String("END")) {
            const QString typeName = content->value.trimmed().toUpper();
            int match = static_cast<int>(stack.size()) - 1;
            while (match >= 0 && stack[static_cast<size_t>(match)]->typeName() != typeName) {
                --match;
            }
            if (match < 0) {
                report(Diagnostic::Severity::Warning, line->lineNumber,
                       QStringLiteral("END:%1 without matching BEGIN").arg(typeName));
                continue;
            }
            for (int i = static_cast<int>(stack.size()) - 1; i > match; --i) {
                report(Diagnostic::Severity::Warning, line->lineNumber,
                       QStringLiteral("%1 closed implicitly by END:%2")
                           .arg(stack[static_cast<size_t>(i)]->typeName(), typeName));
            }
            stack.resize(static_cast<size_t>(match));
            continue;
        }

        if (stack.empty()) {
            report(Diagnostic::Severity::Warning, line->lineNumber,
                   QStringLiteral("property %1 outside of any component").arg(content->name));
            continue;
        }
        stack.back()->addProperty(
            model::Property(content->name, std::move(content->parameters), std::move(content->value), line->lineNumber));
    }

    while (!stack.empty()) {
        report(Diagnostic::Severity::Warning, 0, QStringLiteral("%1 not terminated").arg(stack.back()->typeName()));
        stack.pop_back();
    }

    if (result.roots.empty()) {
        report(Diagnostic::Severity::Warning, 0, QStringLiteral("no component found, using an empty calendar"));
        result.roots.push_back(std::make_shared<Component>(model::componentTypeName(model::ComponentType::Calendar)));
    }

    qCDebug(lcParser) << "parsed" << result.roots.size() << "top-level components with"
                      << result.diagnostics.size() << "diagnostics";
    return result;
}

} // namespace parser
} // namespace icalendar
