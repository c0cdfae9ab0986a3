#pragma once

#include <QString>
#include <QStringList>

class QSettings;

namespace agenda {
namespace core {

struct Settings
{
    QString calendarsPath;
    QString defaultCalendar;
    int listHorizonDays = 30;
    QString syncProgram;
    QStringList syncArguments;

    // ~/.config/agenda/agenda.conf, then AGENDA_CALENDARS_DIR and
    // AGENDA_SYNC_PROGRAM from the environment.
    static Settings load();
    static Settings load(const QSettings &settings);

    static QString expandHome(const QString &path);
};

} // namespace core
} // namespace agenda
