#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

#include "agenda/core/Recurrence.hpp"

namespace agenda {
namespace data {

constexpr auto DefaultCalendar = "personal";
constexpr qint64 DefaultDurationSecs = 60 * 60;

struct EventRecord
{
    QString id;
    QString calendar = QLatin1String(DefaultCalendar);
    QString name;
    QDateTime start;
    QDateTime end;
    QString location;
    QString description;
    std::optional<core::RecurrenceRule> recurrence;

    bool isRecurring() const { return recurrence.has_value(); }
    qint64 durationSecs() const { return start.secsTo(end); }

    bool operator==(const EventRecord &other) const;
    bool operator!=(const EventRecord &other) const { return !(*this == other); }
};

enum class ValidationError
{
    None,
    EmptyName,
    EndNotAfterStart,
    InvalidInterval,
    UntilBeforeStart,
};

QString validationMessage(ValidationError error);
ValidationError validate(const EventRecord &record);

// Fields left empty keep their stored value.
struct EventPatch
{
    std::optional<QString> name;
    std::optional<QDateTime> start;
    std::optional<QDateTime> end;
    std::optional<QString> location;
    std::optional<QString> description;
    std::optional<core::RecurrenceRule> recurrence;
    bool clearRecurrence = false;

    bool isEmpty() const;
};

// Applies the patch and re-validates the result. On failure the record is
// left exactly as it was.
ValidationError applyPatch(EventRecord &record, const EventPatch &patch);

struct EventInstance
{
    core::Occurrence occurrence;
    const EventRecord *record = nullptr;
};

// Occurrences of the record that overlap the window, in start order. The
// instances point at the given record.
std::vector<EventInstance> instancesIn(const EventRecord &record, const core::TimeWindow &window);

// Start of the first occurrence overlapping the window.
std::optional<QDateTime> effectiveStart(const EventRecord &record, const core::TimeWindow &window);

// Every term has to appear, case-insensitively, in the name, location or
// description. An empty term list matches everything.
bool matchesTerms(const EventRecord &record, const QStringList &terms);

} // namespace data
} // namespace agenda
