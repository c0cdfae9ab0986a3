#include <QCoreApplication>
#include <QDate>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "agenda/cli/CommandLine.hpp"
#include "agenda/core/AppContext.hpp"
#include "agenda/core/Logging.hpp"
#include "agenda/core/Settings.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("agenda"));
    QCoreApplication::setApplicationName(QStringLiteral("agenda"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(AgendaVersion));

    QCoreApplication app(argc, argv);
    const QStringList arguments = QCoreApplication::arguments();
    agenda::core::initLogging(arguments.contains(QStringLiteral("--verbose")));

    agenda::core::AppContext context(agenda::core::Settings::load());

    QTextStream out(stdout);
    QTextStream err(stderr);
    QTextStream in(stdin);
    agenda::cli::CommandLine commandLine(context, out, err, in, QDate::currentDate());
    return commandLine.run(arguments);
}
