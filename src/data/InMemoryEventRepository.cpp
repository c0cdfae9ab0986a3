#include "agenda/data/InMemoryEventRepository.hpp"

#include <utility>

namespace agenda {
namespace data {

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

QString InMemoryEventRepository::key(const QString &calendar, const QString &id)
{
    return calendar + QLatin1Char('/') + id;
}

QStringList InMemoryEventRepository::calendars(StoreError *) const
{
    QStringList names;
    for (const auto &event : m_events) {
        if (!names.contains(event.calendar)) {
            names << event.calendar;
        }
    }
    names.sort();
    return names;
}

std::vector<EventRecord> InMemoryEventRepository::fetchEvents(const EventQuery &query, StoreError *) const
{
    std::vector<EventRecord> events;
    for (const auto &event : m_events) {
        events.push_back(event);
    }
    return selectEvents(std::move(events), query);
}

std::optional<EventRecord> InMemoryEventRepository::findById(const QString &calendar, const QString &id, StoreError *error) const
{
    const auto it = m_events.constFind(key(calendar, id));
    if (it == m_events.constEnd()) {
        reportStoreError(error, StoreError::Kind::NotFound, QStringLiteral("no such event '%1'").arg(id));
        return std::nullopt;
    }
    return it.value();
}

std::optional<EventRecord> InMemoryEventRepository::addEvent(EventRecord event, StoreError *error)
{
    if (event.calendar.isEmpty()) {
        event.calendar = QLatin1String(DefaultCalendar);
    }
    const ValidationError invalid = validate(event);
    if (invalid != ValidationError::None) {
        reportStoreError(error, StoreError::Kind::Validation, validationMessage(invalid));
        return std::nullopt;
    }
    event.id = createEventId();
    m_events.insert(key(event.calendar, event.id), event);
    return event;
}

std::optional<EventRecord> InMemoryEventRepository::updateEvent(const QString &calendar,
                                                                const QString &id,
                                                                const EventPatch &patch,
                                                                StoreError *error)
{
    const auto it = m_events.find(key(calendar, id));
    if (it == m_events.end()) {
        reportStoreError(error, StoreError::Kind::NotFound, QStringLiteral("no such event '%1'").arg(id));
        return std::nullopt;
    }
    const ValidationError invalid = applyPatch(it.value(), patch);
    if (invalid != ValidationError::None) {
        reportStoreError(error, StoreError::Kind::Validation, validationMessage(invalid));
        return std::nullopt;
    }
    return it.value();
}

bool InMemoryEventRepository::removeEvent(const QString &calendar, const QString &id, StoreError *error)
{
    if (m_events.remove(key(calendar, id)) > 0) {
        return true;
    }
    reportStoreError(error, StoreError::Kind::NotFound, QStringLiteral("no such event '%1'").arg(id));
    return false;
}

} // namespace data
} // namespace agenda
