#include "agenda/cli/TextPrinter.hpp"

#include <QLocale>
#include <QTextStream>

namespace agenda {
namespace cli {

namespace {
QString clock(const QDateTime &dt)
{
    return QLocale::c().toString(dt.time(), QStringLiteral("HH:mm"));
}

QString unitName(core::Frequency frequency)
{
    switch (frequency) {
    case core::Frequency::Daily:
        return QStringLiteral("days");
    case core::Frequency::Weekly:
        return QStringLiteral("weeks");
    case core::Frequency::Monthly:
        return QStringLiteral("months");
    case core::Frequency::Yearly:
        return QStringLiteral("years");
    }
    return QString();
}
} // namespace

TextPrinter::TextPrinter(QTextStream &out)
    : m_out(out)
{
}

QString TextPrinter::instanceLine(const data::EventInstance &instance, bool showId) const
{
    const QLocale locale = QLocale::c();
    QString line = QStringLiteral("%1 %2-%3 - %4")
                       .arg(locale.toString(instance.occurrence.start.date(), QStringLiteral("ddd dd MMM")),
                            clock(instance.occurrence.start),
                            clock(instance.occurrence.end),
                            instance.record->name);
    if (!instance.record->location.isEmpty()) {
        line += QStringLiteral(" in ") + instance.record->location;
    }
    if (showId) {
        line = instance.record->id + QStringLiteral(": ") + line;
    }
    return line;
}

void TextPrinter::printInstances(const std::vector<data::EventInstance> &instances, bool showId)
{
    for (const data::EventInstance &instance : instances) {
        m_out << instanceLine(instance, showId) << '\n';
    }
    m_out.flush();
}

void TextPrinter::printDays(const std::vector<ui::DayBucket> &days)
{
    const QLocale locale = QLocale::c();
    bool first = true;
    for (const ui::DayBucket &day : days) {
        if (!first) {
            m_out << '\n';
        }
        first = false;

        m_out << locale.toString(day.date, QStringLiteral("dddd, dd MMMM yyyy")) << '\n';
        if (day.instances.empty()) {
            m_out << "  No events\n";
            continue;
        }
        for (const data::EventInstance &instance : day.instances) {
            m_out << "  " << clock(instance.occurrence.start) << '-' << clock(instance.occurrence.end) << "  "
                  << instance.record->name;
            if (!instance.record->location.isEmpty()) {
                m_out << " (" << instance.record->location << ')';
            }
            m_out << '\n';
        }
    }
    m_out.flush();
}

void TextPrinter::printDetails(const data::EventRecord &event)
{
    const QLocale locale = QLocale::c();
    m_out << "Name: " << event.name << '\n';
    m_out << "Calendar: " << event.calendar << '\n';
    m_out << "Date: " << locale.toString(event.start.date(), QStringLiteral("dddd, dd MMMM yyyy")) << '\n';
    if (event.start.date() == event.end.date()) {
        m_out << "Time: " << clock(event.start) << '-' << clock(event.end) << '\n';
    } else {
        m_out << "Until: " << locale.toString(event.end, QStringLiteral("dddd, dd MMMM yyyy HH:mm")) << '\n';
        m_out << "Time: " << clock(event.start) << '\n';
    }
    if (!event.location.isEmpty()) {
        m_out << "Location: " << event.location << '\n';
    }
    if (!event.description.isEmpty()) {
        m_out << "Description: " << event.description << '\n';
    }
    if (event.recurrence) {
        m_out << "Repeats: " << describeRecurrence(*event.recurrence) << '\n';
    }
    m_out << "Id: " << event.id << '\n';
    m_out.flush();
}

void TextPrinter::printDeletionSummary(const data::EventRecord &event)
{
    const QLocale locale = QLocale::c();
    m_out << "You are about to delete '" << event.name << "'\n";
    m_out << "Scheduled for " << locale.toString(event.start.date(), QStringLiteral("dddd, dd MMMM")) << " from "
          << clock(event.start) << " to " << clock(event.end) << '\n';
    if (!event.location.isEmpty()) {
        m_out << "Location: " << event.location << '\n';
    }
    if (event.recurrence) {
        m_out << "This removes the whole series (" << describeRecurrence(*event.recurrence) << ")\n";
    }
    m_out.flush();
}

void TextPrinter::printCalendars(const QStringList &calendars)
{
    for (const QString &calendar : calendars) {
        m_out << calendar << '\n';
    }
    m_out.flush();
}

QString TextPrinter::describeRecurrence(const core::RecurrenceRule &rule)
{
    QString text = rule.interval == 1
        ? core::frequencyName(rule.frequency)
        : QStringLiteral("every %1 %2").arg(rule.interval).arg(unitName(rule.frequency));
    if (rule.hasUntil()) {
        text += QStringLiteral(" until ") + rule.until.toString(Qt::ISODate);
    }
    return text;
}

} // namespace cli
} // namespace agenda
