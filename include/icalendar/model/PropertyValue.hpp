#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <variant>

#include "icalendar/model/Values.hpp"
#include "icalendar/recurrence/RecurrenceRule.hpp"

namespace icalendar {
namespace model {

using PropertyValue = std::variant<QString,
                                   QStringList,
                                   int,
                                   QList<double>,
                                   bool,
                                   DateTimeValue,
                                   QList<DateTimeValue>,
                                   Duration,
                                   QList<Period>,
                                   recurrence::RecurrenceRule,
                                   UtcOffset>;

} // namespace model
} // namespace icalendar
