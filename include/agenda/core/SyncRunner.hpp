#pragma once

#include <QString>
#include <QStringList>

namespace agenda {
namespace core {

// Runs the external synchronization tool. Only its exit status matters; its
// output goes straight to the terminal.
class SyncRunner
{
public:
    SyncRunner(QString program, QStringList arguments);

    bool isAvailable() const;
    bool run(const QString &calendar, QString *errorMessage = nullptr) const;

    QStringList argumentsFor(const QString &calendar) const;

private:
    QString m_program;
    QStringList m_arguments;
};

} // namespace core
} // namespace agenda
