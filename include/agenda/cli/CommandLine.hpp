#pragma once

#include <QDate>
#include <QStringList>

class QCommandLineParser;
class QTextStream;

namespace agenda {
namespace core {
class AppContext;
struct ParseError;
}
namespace data {
struct StoreError;
}

namespace cli {

enum ExitCode
{
    ExitSuccess = 0,
    ExitUserError = 1,
    ExitFatalError = 2,
};

// Dispatches "agenda <command> [options]" to the command handlers. All
// relative dates are resolved against the date given at construction.
class CommandLine
{
public:
    CommandLine(core::AppContext &context, QTextStream &out, QTextStream &err, QTextStream &in, const QDate &today);

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    int run(QStringList arguments);

    static QString usage();

private:
    int runList(const QStringList &arguments);
    int runAdd(const QStringList &arguments);
    int runEdit(const QStringList &arguments);
    int runDelete(const QStringList &arguments);
    int runShow(const QStringList &arguments);
    int runView(const QStringList &arguments);
    int runCalendars(const QStringList &arguments);
    int runSync(const QStringList &arguments);

    // Returns false and sets exitCode when the command has to stop here,
    // either because help was printed or the options were malformed.
    bool parseOptions(QCommandLineParser &parser, const QStringList &arguments, int &exitCode);

    QString calendarOrDefault(const QString &calendar) const;
    int userError(const QString &message);
    int parseFailure(const core::ParseError &error);
    int storeFailure(const data::StoreError &error);

    core::AppContext &m_context;
    QTextStream &m_out;
    QTextStream &m_err;
    QTextStream &m_in;
    QDate m_today;
};

} // namespace cli
} // namespace agenda
