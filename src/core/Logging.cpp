#include "icalendar/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcParser, "icalendar.parser", QtInfoMsg)
Q_LOGGING_CATEGORY(lcModel, "icalendar.model", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRecurrence, "icalendar.recurrence", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTimeline, "icalendar.timeline", QtInfoMsg)
Q_LOGGING_CATEGORY(lcIo, "icalendar.io", QtInfoMsg)
