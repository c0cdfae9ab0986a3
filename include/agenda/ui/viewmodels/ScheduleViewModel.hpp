#pragma once

#include <QDate>
#include <QObject>
#include <QStringList>
#include <optional>
#include <vector>

#include "agenda/data/Event.hpp"
#include "agenda/data/StoreError.hpp"

namespace agenda {
namespace data {
class EventRepository;
}

namespace ui {

enum class ViewMode
{
    Day,
    Week,
    Month,
};

std::optional<ViewMode> viewModeFromName(const QString &name);

struct DateRange
{
    QDate first;
    QDate last;
};

// count consecutive days, Monday-based weeks or calendar months from anchor.
DateRange viewRange(ViewMode mode, const QDate &anchor, int count);

struct DayBucket
{
    QDate date;
    std::vector<data::EventInstance> instances;
};

class ScheduleViewModel : public QObject
{
    Q_OBJECT

public:
    ScheduleViewModel(data::EventRepository &repository, QObject *parent = nullptr);

    void setRange(const QDate &start, const QDate &end);
    void setCalendar(const QString &calendar);
    void setTerms(const QStringList &terms);
    bool refresh(data::StoreError *error = nullptr);

    const std::vector<data::EventRecord> &events() const;
    // Every occurrence in the range, ordered by start.
    const std::vector<data::EventInstance> &instances() const;
    // One bucket per day of the range; an occurrence spanning midnight shows
    // up in each day it touches.
    std::vector<DayBucket> days() const;

signals:
    void eventsChanged();

private:
    data::EventRepository &m_repository;
    QDate m_start;
    QDate m_end;
    QString m_calendar;
    QStringList m_terms;
    std::vector<data::EventRecord> m_events;
    std::vector<data::EventInstance> m_instances;
};

} // namespace ui
} // namespace agenda
