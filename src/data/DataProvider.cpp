#include "agenda/data/DataProvider.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/data/FileCalendarStorage.hpp"
#include "agenda/data/FileEventRepository.hpp"

#include <QDir>

namespace agenda {
namespace data {

DataProvider::DataProvider(const QString &calendarsPath)
{
    QString storageFolder = calendarsPath;
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.calendars");
    }
    QDir dir(storageFolder);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(AGENDA_STORE_LOG) << "cannot create calendar directory" << storageFolder;
    }

    m_calendarStorage = std::make_shared<FileCalendarStorage>(dir.absolutePath());
    m_eventRepository = std::make_unique<FileEventRepository>(m_calendarStorage);
}

DataProvider::~DataProvider() = default;

EventRepository &DataProvider::eventRepository()
{
    return *m_eventRepository;
}

} // namespace data
} // namespace agenda
