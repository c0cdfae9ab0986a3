#include "agenda/core/Settings.hpp"

#include "agenda/core/Logging.hpp"

#include <QDir>
#include <QSettings>

namespace agenda {
namespace core {

namespace {
const QString PATH_KEY = QStringLiteral("storage/path");
const QString DEFAULT_CALENDAR_KEY = QStringLiteral("storage/defaultCalendar");
const QString HORIZON_KEY = QStringLiteral("list/horizonDays");
const QString SYNC_PROGRAM_KEY = QStringLiteral("sync/program");
const QString SYNC_ARGUMENTS_KEY = QStringLiteral("sync/arguments");

constexpr int DEFAULT_HORIZON_DAYS = 30;
} // namespace

Settings Settings::load()
{
    const QSettings settings(QSettings::IniFormat,
                             QSettings::UserScope,
                             QStringLiteral("agenda"),
                             QStringLiteral("agenda"));
    return load(settings);
}

Settings Settings::load(const QSettings &settings)
{
    Settings result;
    result.calendarsPath = settings.value(PATH_KEY, QStringLiteral("~/.calendars")).toString();
    result.defaultCalendar = settings.value(DEFAULT_CALENDAR_KEY, QStringLiteral("personal")).toString().trimmed();
    result.syncProgram = settings.value(SYNC_PROGRAM_KEY, QStringLiteral("vdirsyncer")).toString();
    result.syncArguments = settings.value(SYNC_ARGUMENTS_KEY, QStringLiteral("sync --force-delete"))
                               .toString()
                               .split(QLatin1Char(' '), Qt::SkipEmptyParts);

    bool ok = false;
    result.listHorizonDays = settings.value(HORIZON_KEY, DEFAULT_HORIZON_DAYS).toInt(&ok);
    if (!ok || result.listHorizonDays < 0) {
        qCWarning(AGENDA_CLI_LOG) << "ignoring invalid" << HORIZON_KEY << settings.value(HORIZON_KEY);
        result.listHorizonDays = DEFAULT_HORIZON_DAYS;
    }
    if (result.defaultCalendar.isEmpty()) {
        result.defaultCalendar = QStringLiteral("personal");
    }

    const QString pathOverride = qEnvironmentVariable("AGENDA_CALENDARS_DIR");
    if (!pathOverride.isEmpty()) {
        result.calendarsPath = pathOverride;
    }
    const QString syncOverride = qEnvironmentVariable("AGENDA_SYNC_PROGRAM");
    if (!syncOverride.isEmpty()) {
        result.syncProgram = syncOverride;
    }

    result.calendarsPath = expandHome(result.calendarsPath);
    return result;
}

QString Settings::expandHome(const QString &path)
{
    if (path == QLatin1String("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

} // namespace core
} // namespace agenda
