#include "agenda/core/SyncRunner.hpp"

#include "agenda/core/Logging.hpp"

#include <QProcess>
#include <QStandardPaths>

#include <utility>

namespace agenda {
namespace core {

SyncRunner::SyncRunner(QString program, QStringList arguments)
    : m_program(std::move(program))
    , m_arguments(std::move(arguments))
{
}

bool SyncRunner::isAvailable() const
{
    if (m_program.isEmpty() || QStandardPaths::findExecutable(m_program).isEmpty()) {
        return false;
    }

    QProcess process;
    process.start(m_program, QStringList() << QStringLiteral("--version"));
    if (!process.waitForStarted(3000) || !process.waitForFinished(10000)) {
        process.kill();
        process.waitForFinished();
        return false;
    }
    return process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
}

QStringList SyncRunner::argumentsFor(const QString &calendar) const
{
    QStringList arguments = m_arguments;
    if (!calendar.isEmpty()) {
        arguments << calendar;
    }
    return arguments;
}

bool SyncRunner::run(const QString &calendar, QString *errorMessage) const
{
    const QStringList arguments = argumentsFor(calendar);
    qCInfo(AGENDA_SYNC_LOG) << "running" << m_program << arguments;

    QProcess process;
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.start(m_program, arguments);
    if (!process.waitForStarted()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("failed to run %1: %2").arg(m_program, process.errorString());
        }
        return false;
    }
    process.waitForFinished(-1);

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 failed with exit code %2").arg(m_program).arg(process.exitCode());
        }
        qCWarning(AGENDA_SYNC_LOG) << m_program << "exited with" << process.exitCode();
        return false;
    }
    return true;
}

} // namespace core
} // namespace agenda
