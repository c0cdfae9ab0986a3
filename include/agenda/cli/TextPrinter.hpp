#pragma once

#include <QStringList>
#include <vector>

#include "agenda/data/Event.hpp"
#include "agenda/ui/viewmodels/ScheduleViewModel.hpp"

class QTextStream;

namespace agenda {
namespace cli {

// Plain text output, no colors and no terminal width handling.
class TextPrinter
{
public:
    explicit TextPrinter(QTextStream &out);

    // "Mon 08 Jan 10:00-11:00 - Standup in Room 2"
    QString instanceLine(const data::EventInstance &instance, bool showId) const;

    void printInstances(const std::vector<data::EventInstance> &instances, bool showId);
    void printDays(const std::vector<ui::DayBucket> &days);
    void printDetails(const data::EventRecord &event);
    void printDeletionSummary(const data::EventRecord &event);
    void printCalendars(const QStringList &calendars);

    static QString describeRecurrence(const core::RecurrenceRule &rule);

private:
    QTextStream &m_out;
};

} // namespace cli
} // namespace agenda
