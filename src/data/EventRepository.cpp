#include "agenda/data/EventRepository.hpp"

#include "agenda/core/Logging.hpp"

#include <QUuid>

#include <algorithm>
#include <utility>

namespace agenda {
namespace data {

void reportStoreError(StoreError *target, StoreError::Kind kind, const QString &message, const QString &path)
{
    if (kind == StoreError::Kind::Io) {
        qCWarning(AGENDA_STORE_LOG).noquote() << message << (path.isEmpty() ? QString() : QStringLiteral("(%1)").arg(path));
    } else {
        qCDebug(AGENDA_STORE_LOG).noquote() << message;
    }
    if (!target) {
        return;
    }
    target->kind = kind;
    target->message = message;
    target->path = path;
}

QString createEventId()
{
    // Version 4 UUID from the system random source.
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

std::vector<EventRecord> selectEvents(std::vector<EventRecord> candidates, const EventQuery &query)
{
    std::vector<std::pair<QDateTime, EventRecord>> selected;
    selected.reserve(candidates.size());
    for (EventRecord &record : candidates) {
        if (!query.calendar.isEmpty() && record.calendar != query.calendar) {
            continue;
        }
        if (!matchesTerms(record, query.terms)) {
            continue;
        }
        std::optional<QDateTime> start = effectiveStart(record, query.window);
        if (!start) {
            continue;
        }
        selected.emplace_back(std::move(*start), std::move(record));
    }

    std::sort(selected.begin(), selected.end(), [](const auto &lhs, const auto &rhs) {
        if (lhs.first != rhs.first) {
            return lhs.first < rhs.first;
        }
        if (lhs.second.end != rhs.second.end) {
            return lhs.second.end < rhs.second.end;
        }
        if (lhs.second.name != rhs.second.name) {
            return lhs.second.name < rhs.second.name;
        }
        return lhs.second.id < rhs.second.id;
    });

    std::vector<EventRecord> result;
    result.reserve(selected.size());
    for (auto &entry : selected) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

} // namespace data
} // namespace agenda
