#include "agenda/core/Logging.hpp"

#include <QString>

Q_LOGGING_CATEGORY(AGENDA_PARSE_LOG, "agenda.parse", QtInfoMsg)
Q_LOGGING_CATEGORY(AGENDA_RECURRENCE_LOG, "agenda.recurrence", QtInfoMsg)
Q_LOGGING_CATEGORY(AGENDA_STORE_LOG, "agenda.store", QtInfoMsg)
Q_LOGGING_CATEGORY(AGENDA_SYNC_LOG, "agenda.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(AGENDA_CLI_LOG, "agenda.cli", QtInfoMsg)

namespace agenda {
namespace core {

void initLogging(bool verbose)
{
    qSetMessagePattern(QStringLiteral("agenda: [%{category}] %{type}: %{message}"));

    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("agenda.*.debug=true"));
        return;
    }
    if (qEnvironmentVariableIsEmpty("QT_LOGGING_RULES")) {
        QLoggingCategory::setFilterRules(QStringLiteral("agenda.*.info=false\n"
                                                        "agenda.*.debug=false"));
    }
}

} // namespace core
} // namespace agenda
