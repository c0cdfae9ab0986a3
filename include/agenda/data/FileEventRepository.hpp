#pragma once

#include "agenda/data/EventRepository.hpp"
#include "agenda/data/FileCalendarStorage.hpp"

#include <memory>

namespace agenda {
namespace data {

class FileEventRepository : public EventRepository
{
public:
    explicit FileEventRepository(std::shared_ptr<FileCalendarStorage> storage);
    ~FileEventRepository() override = default;

    QStringList calendars(StoreError *error = nullptr) const override;
    std::vector<EventRecord> fetchEvents(const EventQuery &query, StoreError *error = nullptr) const override;
    std::optional<EventRecord> findById(const QString &calendar,
                                        const QString &id,
                                        StoreError *error = nullptr) const override;
    std::optional<EventRecord> addEvent(EventRecord event, StoreError *error = nullptr) override;
    std::optional<EventRecord> updateEvent(const QString &calendar,
                                           const QString &id,
                                           const EventPatch &patch,
                                           StoreError *error = nullptr) override;
    bool removeEvent(const QString &calendar, const QString &id, StoreError *error = nullptr) override;

private:
    bool loadCalendar(const QString &calendar, std::vector<EventRecord> &events, StoreError *error) const;

    std::shared_ptr<FileCalendarStorage> m_storage;
};

} // namespace data
} // namespace agenda
