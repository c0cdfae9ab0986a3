#pragma once

#include <QStringList>

#include <optional>
#include <vector>

#include "agenda/core/Recurrence.hpp"
#include "agenda/data/Event.hpp"
#include "agenda/data/StoreError.hpp"

namespace agenda {
namespace data {

struct EventQuery
{
    QString calendar; // empty: every calendar
    core::TimeWindow window;
    QStringList terms;
};

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    virtual QStringList calendars(StoreError *error = nullptr) const = 0;

    // Records with at least one occurrence in the window, sorted by the start
    // of that first occurrence.
    virtual std::vector<EventRecord> fetchEvents(const EventQuery &query, StoreError *error = nullptr) const = 0;
    virtual std::optional<EventRecord> findById(const QString &calendar,
                                                const QString &id,
                                                StoreError *error = nullptr) const = 0;
    // Assigns a fresh id; the stored record is returned.
    virtual std::optional<EventRecord> addEvent(EventRecord event, StoreError *error = nullptr) = 0;
    virtual std::optional<EventRecord> updateEvent(const QString &calendar,
                                                   const QString &id,
                                                   const EventPatch &patch,
                                                   StoreError *error = nullptr) = 0;
    virtual bool removeEvent(const QString &calendar, const QString &id, StoreError *error = nullptr) = 0;
};

QString createEventId();

// Applies the window and term filters of a query and sorts the survivors by
// effective start, then end, name and id.
std::vector<EventRecord> selectEvents(std::vector<EventRecord> candidates, const EventQuery &query);

} // namespace data
} // namespace agenda
