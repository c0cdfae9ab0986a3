#include "agenda/data/Event.hpp"

#include <utility>

namespace agenda {
namespace data {

bool EventRecord::operator==(const EventRecord &other) const
{
    return id == other.id
        && calendar == other.calendar
        && name == other.name
        && start == other.start
        && end == other.end
        && location == other.location
        && description == other.description
        && recurrence == other.recurrence;
}

QString validationMessage(ValidationError error)
{
    switch (error) {
    case ValidationError::EmptyName:
        return QStringLiteral("event name cannot be empty");
    case ValidationError::EndNotAfterStart:
        return QStringLiteral("end time must be after start time");
    case ValidationError::InvalidInterval:
        return QStringLiteral("repeat interval must be at least 1");
    case ValidationError::UntilBeforeStart:
        return QStringLiteral("repeat end date lies before the first occurrence");
    case ValidationError::None:
        break;
    }
    return QString();
}

ValidationError validate(const EventRecord &record)
{
    if (record.name.trimmed().isEmpty()) {
        return ValidationError::EmptyName;
    }
    if (!record.start.isValid() || !record.end.isValid() || record.end <= record.start) {
        return ValidationError::EndNotAfterStart;
    }
    if (record.recurrence) {
        if (record.recurrence->interval < 1) {
            return ValidationError::InvalidInterval;
        }
        if (record.recurrence->hasUntil() && record.recurrence->until < record.start.date()) {
            return ValidationError::UntilBeforeStart;
        }
    }
    return ValidationError::None;
}

bool EventPatch::isEmpty() const
{
    return !name && !start && !end && !location && !description && !recurrence && !clearRecurrence;
}

ValidationError applyPatch(EventRecord &record, const EventPatch &patch)
{
    EventRecord updated = record;
    if (patch.name) {
        updated.name = *patch.name;
    }
    if (patch.start) {
        updated.start = *patch.start;
    }
    if (patch.end) {
        updated.end = *patch.end;
    }
    if (patch.location) {
        updated.location = *patch.location;
    }
    if (patch.description) {
        updated.description = *patch.description;
    }
    if (patch.clearRecurrence) {
        updated.recurrence.reset();
    } else if (patch.recurrence) {
        updated.recurrence = patch.recurrence;
    }

    const ValidationError error = validate(updated);
    if (error == ValidationError::None) {
        record = std::move(updated);
    }
    return error;
}

std::vector<EventInstance> instancesIn(const EventRecord &record, const core::TimeWindow &window)
{
    std::vector<EventInstance> instances;
    if (!record.recurrence) {
        if (window.intersects(record.start, record.end)) {
            instances.push_back({core::Occurrence{record.start, record.end}, &record});
        }
        return instances;
    }

    // Elapsed seconds, so a 1h event stays 1h across daylight-saving changes.
    core::RecurrenceExpander expander(record.start, *record.recurrence, window, record.durationSecs());
    while (const std::optional<core::Occurrence> occurrence = expander.next()) {
        instances.push_back({*occurrence, &record});
    }
    return instances;
}

std::optional<QDateTime> effectiveStart(const EventRecord &record, const core::TimeWindow &window)
{
    if (!record.recurrence) {
        if (window.intersects(record.start, record.end)) {
            return record.start;
        }
        return std::nullopt;
    }
    core::RecurrenceExpander expander(record.start, *record.recurrence, window, record.durationSecs());
    if (const std::optional<core::Occurrence> first = expander.next()) {
        return first->start;
    }
    return std::nullopt;
}

bool matchesTerms(const EventRecord &record, const QStringList &terms)
{
    for (const QString &term : terms) {
        const QString needle = term.trimmed();
        if (needle.isEmpty()) {
            continue;
        }
        const bool found = record.name.contains(needle, Qt::CaseInsensitive)
            || record.location.contains(needle, Qt::CaseInsensitive)
            || record.description.contains(needle, Qt::CaseInsensitive);
        if (!found) {
            return false;
        }
    }
    return true;
}

} // namespace data
} // namespace agenda
