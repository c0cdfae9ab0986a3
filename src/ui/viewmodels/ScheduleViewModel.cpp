#include "agenda/ui/viewmodels/ScheduleViewModel.hpp"

#include "agenda/data/EventRepository.hpp"

#include <algorithm>
#include <utility>

namespace agenda {
namespace ui {

std::optional<ViewMode> viewModeFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("day") || normalized == QLatin1String("d")) {
        return ViewMode::Day;
    }
    if (normalized == QLatin1String("week") || normalized == QLatin1String("w")) {
        return ViewMode::Week;
    }
    if (normalized == QLatin1String("month") || normalized == QLatin1String("m")) {
        return ViewMode::Month;
    }
    return std::nullopt;
}

DateRange viewRange(ViewMode mode, const QDate &anchor, int count)
{
    const int periods = std::max(1, count);
    DateRange range;
    switch (mode) {
    case ViewMode::Day:
        range.first = anchor;
        range.last = anchor.addDays(periods - 1);
        break;
    case ViewMode::Week:
        range.first = anchor.addDays(1 - anchor.dayOfWeek());
        range.last = range.first.addDays(7 * periods - 1);
        break;
    case ViewMode::Month:
        range.first = QDate(anchor.year(), anchor.month(), 1);
        range.last = range.first.addMonths(periods).addDays(-1);
        break;
    }
    return range;
}

ScheduleViewModel::ScheduleViewModel(data::EventRepository &repository, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
{
}

void ScheduleViewModel::setRange(const QDate &start, const QDate &end)
{
    if (!start.isValid() || !end.isValid() || end < start) {
        return;
    }
    m_start = start;
    m_end = end;
}

void ScheduleViewModel::setCalendar(const QString &calendar)
{
    m_calendar = calendar;
}

void ScheduleViewModel::setTerms(const QStringList &terms)
{
    m_terms = terms;
}

bool ScheduleViewModel::refresh(data::StoreError *error)
{
    if (!m_start.isValid() || !m_end.isValid()) {
        return false;
    }

    data::EventQuery query;
    query.calendar = m_calendar;
    query.window = core::TimeWindow::forDays(m_start, m_end);
    query.terms = m_terms;

    data::StoreError fetchError;
    std::vector<data::EventRecord> events = m_repository.fetchEvents(query, &fetchError);
    if (fetchError.isError()) {
        if (error) {
            *error = fetchError;
        }
        return false;
    }

    m_instances.clear();
    m_events = std::move(events);
    for (const data::EventRecord &event : m_events) {
        const std::vector<data::EventInstance> instances = data::instancesIn(event, query.window);
        m_instances.insert(m_instances.end(), instances.begin(), instances.end());
    }
    std::stable_sort(m_instances.begin(), m_instances.end(), [](const data::EventInstance &lhs, const data::EventInstance &rhs) {
        if (lhs.occurrence.start == rhs.occurrence.start) {
            return lhs.occurrence.end < rhs.occurrence.end;
        }
        return lhs.occurrence.start < rhs.occurrence.start;
    });

    emit eventsChanged();
    return true;
}

const std::vector<data::EventRecord> &ScheduleViewModel::events() const
{
    return m_events;
}

const std::vector<data::EventInstance> &ScheduleViewModel::instances() const
{
    return m_instances;
}

std::vector<DayBucket> ScheduleViewModel::days() const
{
    std::vector<DayBucket> buckets;
    if (!m_start.isValid() || !m_end.isValid()) {
        return buckets;
    }
    for (QDate day = m_start; day <= m_end; day = day.addDays(1)) {
        const core::TimeWindow window = core::TimeWindow::forDays(day, day);
        DayBucket bucket;
        bucket.date = day;
        for (const data::EventInstance &instance : m_instances) {
            if (window.intersects(instance.occurrence.start, instance.occurrence.end)) {
                bucket.instances.push_back(instance);
            }
        }
        buckets.push_back(std::move(bucket));
    }
    return buckets;
}

} // namespace ui
} // namespace agenda
