#include "agenda/core/Recurrence.hpp"

#include "agenda/core/Logging.hpp"

#include <QTime>

#include <algorithm>
#include <utility>

namespace agenda {
namespace core {

namespace {
constexpr qint64 SECS_PER_DAY = 24 * 60 * 60;

QDateTime atWallClock(const QDate &date, const QTime &time)
{
    QDateTime result(date, time, Qt::LocalTime);
    if (!result.isValid()) {
        // Wall-clock time skipped by a daylight-saving transition: count the
        // elapsed time from midnight instead, which lands just after the gap.
        result = QDateTime(date, QTime(0, 0), Qt::LocalTime).addSecs(QTime(0, 0).secsTo(time));
    }
    return result;
}
} // namespace

QString frequencyName(Frequency frequency)
{
    switch (frequency) {
    case Frequency::Daily:
        return QStringLiteral("daily");
    case Frequency::Weekly:
        return QStringLiteral("weekly");
    case Frequency::Monthly:
        return QStringLiteral("monthly");
    case Frequency::Yearly:
        return QStringLiteral("yearly");
    }
    return QString();
}

std::optional<Frequency> frequencyFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("daily")) {
        return Frequency::Daily;
    }
    if (normalized == QLatin1String("weekly")) {
        return Frequency::Weekly;
    }
    if (normalized == QLatin1String("monthly")) {
        return Frequency::Monthly;
    }
    if (normalized == QLatin1String("yearly")) {
        return Frequency::Yearly;
    }
    return std::nullopt;
}

TimeWindow TimeWindow::forDays(const QDate &first, const QDate &last)
{
    TimeWindow window;
    window.start = QDateTime(first, QTime(0, 0), Qt::LocalTime);
    window.end = QDateTime(last.addDays(1), QTime(0, 0), Qt::LocalTime);
    return window;
}

bool TimeWindow::intersects(const QDateTime &from, const QDateTime &to) const
{
    if (from == to) {
        return from >= start && from < end;
    }
    return from < end && to > start;
}

RecurrenceExpander::RecurrenceExpander(QDateTime first, RecurrenceRule rule, TimeWindow window, qint64 durationSecs)
    : m_first(std::move(first))
    , m_rule(rule)
    , m_window(std::move(window))
    , m_durationSecs(std::max<qint64>(0, durationSecs))
{
    if (!m_first.isValid() || !m_window.isValid() || m_rule.interval < 1) {
        qCWarning(AGENDA_RECURRENCE_LOG) << "refusing to expand rule with interval" << m_rule.interval
                                         << "from" << m_first;
        m_finished = true;
        return;
    }
    m_step = firstUsefulStep();
}

std::optional<Occurrence> RecurrenceExpander::next()
{
    while (!m_finished) {
        const QDateTime start = candidate(m_step);
        ++m_step;

        if (!start.isValid() || start >= m_window.end) {
            m_finished = true;
            break;
        }
        if (m_rule.hasUntil() && start.date() > m_rule.until) {
            m_finished = true;
            break;
        }

        const QDateTime end = start.addSecs(m_durationSecs);
        if (m_window.intersects(start, end)) {
            return Occurrence{start, end};
        }
    }
    return std::nullopt;
}

QDateTime RecurrenceExpander::candidate(qint64 step) const
{
    const qint64 units = step * m_rule.interval;
    const QDate firstDate = m_first.date();

    QDate date;
    switch (m_rule.frequency) {
    case Frequency::Daily:
        date = firstDate.addDays(units);
        break;
    case Frequency::Weekly:
        date = firstDate.addDays(7 * units);
        break;
    case Frequency::Monthly:
        // QDate::addMonths clamps to the last day of shorter months.
        date = firstDate.addMonths(static_cast<int>(units));
        break;
    case Frequency::Yearly:
        date = firstDate.addYears(static_cast<int>(units));
        break;
    }
    if (!date.isValid()) {
        return QDateTime();
    }
    return atWallClock(date, m_first.time());
}

// Skips steps that certainly end before the window starts. The margin of two
// units keeps clamping and daylight-saving shifts on the safe side.
qint64 RecurrenceExpander::firstUsefulStep() const
{
    const QDate firstDate = m_first.date();
    const QDate windowDate = m_window.start.date();
    const qint64 durationDays = m_durationSecs / SECS_PER_DAY;

    qint64 lead = 0;
    qint64 unitsPerStep = m_rule.interval;
    switch (m_rule.frequency) {
    case Frequency::Daily:
        lead = firstDate.daysTo(windowDate) - durationDays - 2;
        break;
    case Frequency::Weekly:
        lead = firstDate.daysTo(windowDate) - durationDays - 2;
        unitsPerStep *= 7;
        break;
    case Frequency::Monthly:
        lead = (windowDate.year() - firstDate.year()) * 12 + (windowDate.month() - firstDate.month())
            - durationDays / 28 - 2;
        break;
    case Frequency::Yearly:
        lead = (windowDate.year() - firstDate.year()) - durationDays / 365 - 2;
        break;
    }
    if (lead <= 0) {
        return 0;
    }
    return lead / unitsPerStep;
}

std::vector<Occurrence> expand(const QDateTime &first,
                               const RecurrenceRule &rule,
                               const TimeWindow &window,
                               qint64 durationSecs)
{
    std::vector<Occurrence> occurrences;
    RecurrenceExpander expander(first, rule, window, durationSecs);
    while (const std::optional<Occurrence> occurrence = expander.next()) {
        occurrences.push_back(*occurrence);
    }
    return occurrences;
}

} // namespace core
} // namespace agenda
