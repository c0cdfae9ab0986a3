#pragma once

#include <memory>
#include <QString>

namespace agenda {
namespace data {

class EventRepository;
class FileCalendarStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &calendarsPath);
    ~DataProvider();

    EventRepository &eventRepository();

private:
    std::shared_ptr<FileCalendarStorage> m_calendarStorage;
    std::unique_ptr<EventRepository> m_eventRepository;
};

} // namespace data
} // namespace agenda
