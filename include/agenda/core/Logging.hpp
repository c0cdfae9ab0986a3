#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(AGENDA_PARSE_LOG)
Q_DECLARE_LOGGING_CATEGORY(AGENDA_RECURRENCE_LOG)
Q_DECLARE_LOGGING_CATEGORY(AGENDA_STORE_LOG)
Q_DECLARE_LOGGING_CATEGORY(AGENDA_SYNC_LOG)
Q_DECLARE_LOGGING_CATEGORY(AGENDA_CLI_LOG)

namespace agenda {
namespace core {

// Routes Qt messages to stderr with the agenda prefix. Debug output of the
// agenda categories stays off unless verbose is set or QT_LOGGING_RULES says
// otherwise.
void initLogging(bool verbose);

} // namespace core
} // namespace agenda
