#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>

#include <optional>
#include <vector>

namespace agenda {
namespace core {

enum class Frequency
{
    Daily,
    Weekly,
    Monthly,
    Yearly,
};

// Lower-case vocabulary used on the command line ("daily", "weekly", ...).
QString frequencyName(Frequency frequency);
std::optional<Frequency> frequencyFromName(const QString &name);

struct RecurrenceRule
{
    Frequency frequency = Frequency::Daily;
    int interval = 1;
    QDate until; // invalid when the rule repeats forever

    bool hasUntil() const { return until.isValid(); }

    bool operator==(const RecurrenceRule &other) const
    {
        return frequency == other.frequency && interval == other.interval && until == other.until;
    }
    bool operator!=(const RecurrenceRule &other) const { return !(*this == other); }
};

// Half-open [start, end) range of local instants.
struct TimeWindow
{
    QDateTime start;
    QDateTime end;

    static TimeWindow forDays(const QDate &first, const QDate &last);

    bool isValid() const { return start.isValid() && end.isValid() && start < end; }
    bool intersects(const QDateTime &from, const QDateTime &to) const;
};

struct Occurrence
{
    QDateTime start;
    QDateTime end;

    bool operator==(const Occurrence &other) const { return start == other.start && end == other.end; }
    bool operator!=(const Occurrence &other) const { return !(*this == other); }
};

// Walks the occurrences of a rule that overlap a window, one at a time.
// The n-th candidate is derived from the first occurrence directly, so a
// monthly rule anchored on the 31st clamps to each shorter month on its own
// (Jan 31, Feb 29, Mar 31, Apr 30). Iteration ends at the first candidate
// starting at or after the window end or dated after the rule's until date.
class RecurrenceExpander
{
public:
    RecurrenceExpander(QDateTime first, RecurrenceRule rule, TimeWindow window, qint64 durationSecs = 0);

    std::optional<Occurrence> next();

private:
    QDateTime candidate(qint64 step) const;
    qint64 firstUsefulStep() const;

    QDateTime m_first;
    RecurrenceRule m_rule;
    TimeWindow m_window;
    qint64 m_durationSecs = 0;
    qint64 m_step = 0;
    bool m_finished = false;
};

std::vector<Occurrence> expand(const QDateTime &first,
                               const RecurrenceRule &rule,
                               const TimeWindow &window,
                               qint64 durationSecs = 0);

} // namespace core
} // namespace agenda
