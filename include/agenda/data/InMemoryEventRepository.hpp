#pragma once

#include <QHash>

#include "agenda/data/EventRepository.hpp"

namespace agenda {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

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
    static QString key(const QString &calendar, const QString &id);

    QHash<QString, EventRecord> m_events;
};

} // namespace data
} // namespace agenda
