#include "agenda/data/FileEventRepository.hpp"

#include "agenda/core/Logging.hpp"

#include <utility>

namespace agenda {
namespace data {

namespace {
QString noSuchEvent(const QString &calendar, const QString &id)
{
    return QStringLiteral("no such event '%1' in calendar '%2'").arg(id, calendar);
}
} // namespace

FileEventRepository::FileEventRepository(std::shared_ptr<FileCalendarStorage> storage)
    : m_storage(std::move(storage))
{
}

QStringList FileEventRepository::calendars(StoreError *error) const
{
    return m_storage->calendars(error);
}

std::vector<EventRecord> FileEventRepository::fetchEvents(const EventQuery &query, StoreError *error) const
{
    QStringList names;
    if (query.calendar.isEmpty()) {
        StoreError listError;
        names = m_storage->calendars(&listError);
        if (listError.isError()) {
            if (error) {
                *error = listError;
            }
            return {};
        }
    } else {
        names << query.calendar;
    }

    std::vector<EventRecord> events;
    for (const QString &name : names) {
        if (!loadCalendar(name, events, error)) {
            return {};
        }
    }
    return selectEvents(std::move(events), query);
}

bool FileEventRepository::loadCalendar(const QString &calendar, std::vector<EventRecord> &events, StoreError *error) const
{
    StoreError listError;
    const QStringList files = m_storage->eventFiles(calendar, &listError);
    if (listError.isError()) {
        if (error) {
            *error = listError;
        }
        return false;
    }

    for (const QString &file : files) {
        std::optional<EventRecord> event = m_storage->readEvent(file, calendar, error);
        if (!event) {
            return false;
        }
        events.push_back(std::move(*event));
    }
    qCDebug(AGENDA_STORE_LOG) << "loaded" << files.size() << "events from" << calendar;
    return true;
}

std::optional<EventRecord> FileEventRepository::findById(const QString &calendar, const QString &id, StoreError *error) const
{
    const QString file = m_storage->findEventFile(calendar, id);
    if (file.isEmpty()) {
        reportStoreError(error, StoreError::Kind::NotFound, noSuchEvent(calendar, id));
        return std::nullopt;
    }
    return m_storage->readEvent(file, calendar, error);
}

std::optional<EventRecord> FileEventRepository::addEvent(EventRecord event, StoreError *error)
{
    if (event.calendar.isEmpty()) {
        event.calendar = QLatin1String(DefaultCalendar);
    }
    if (!FileCalendarStorage::isValidCalendarName(event.calendar)) {
        reportStoreError(error, StoreError::Kind::Validation, QStringLiteral("invalid calendar name '%1'").arg(event.calendar));
        return std::nullopt;
    }
    const ValidationError invalid = validate(event);
    if (invalid != ValidationError::None) {
        reportStoreError(error, StoreError::Kind::Validation, validationMessage(invalid));
        return std::nullopt;
    }

    event.id = createEventId();
    if (!m_storage->writeEvent(m_storage->newEventFile(event.calendar, event.id), event, error)) {
        return std::nullopt;
    }
    qCInfo(AGENDA_STORE_LOG) << "added event" << event.id << "to" << event.calendar;
    return event;
}

std::optional<EventRecord> FileEventRepository::updateEvent(const QString &calendar,
                                                            const QString &id,
                                                            const EventPatch &patch,
                                                            StoreError *error)
{
    const QString file = m_storage->findEventFile(calendar, id);
    if (file.isEmpty()) {
        reportStoreError(error, StoreError::Kind::NotFound, noSuchEvent(calendar, id));
        return std::nullopt;
    }
    std::optional<EventRecord> event = m_storage->readEvent(file, calendar, error);
    if (!event) {
        return std::nullopt;
    }
    if (patch.isEmpty()) {
        return event;
    }

    const ValidationError invalid = applyPatch(*event, patch);
    if (invalid != ValidationError::None) {
        reportStoreError(error, StoreError::Kind::Validation, validationMessage(invalid));
        return std::nullopt;
    }
    if (!m_storage->writeEvent(file, *event, error)) {
        return std::nullopt;
    }
    qCInfo(AGENDA_STORE_LOG) << "updated event" << id << "in" << calendar;
    return event;
}

bool FileEventRepository::removeEvent(const QString &calendar, const QString &id, StoreError *error)
{
    const QString file = m_storage->findEventFile(calendar, id);
    if (file.isEmpty()) {
        reportStoreError(error, StoreError::Kind::NotFound, noSuchEvent(calendar, id));
        return false;
    }
    if (!m_storage->removeEventFile(file, error)) {
        return false;
    }
    qCInfo(AGENDA_STORE_LOG) << "removed event" << id << "from" << calendar;
    return true;
}

} // namespace data
} // namespace agenda
