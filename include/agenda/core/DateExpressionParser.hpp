#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>

#include <optional>
#include <vector>

namespace agenda {
namespace core {

struct ParseError
{
    enum class Kind
    {
        None,
        UnrecognizedFormat,
        InvalidDate,
        InvalidTime,
        MissingTime,
    };

    Kind kind = Kind::None;
    QString input;

    bool isError() const { return kind != Kind::None; }
    QString message() const;
};

enum class TimeRequirement
{
    Optional,
    Required,
};

// Date recognizers report whether the text belongs to their grammar class.
// Rejected means the class matched but the value is not a valid date, which
// ends the search.
enum class MatchStatus
{
    NoMatch,
    Matched,
    Rejected,
};

struct DateMatch
{
    MatchStatus status = MatchStatus::NoMatch;
    QDate date;
    ParseError::Kind error = ParseError::Kind::None;
};

// Recognizers receive lower-cased, trimmed text.
using DateRecognizer = DateMatch (*)(const QString &text, const QDate &reference);

struct NamedRecognizer
{
    const char *name;
    DateRecognizer recognize;
};

namespace recognizers {
DateMatch fullNumericDate(const QString &text, const QDate &reference);
DateMatch shortNumericDate(const QString &text, const QDate &reference);
DateMatch relativeKeyword(const QString &text, const QDate &reference);
DateMatch weekdayName(const QString &text, const QDate &reference);
DateMatch monthName(const QString &text, const QDate &reference);
DateMatch monthWithYear(const QString &text, const QDate &reference);
DateMatch dayWithMonthName(const QString &text, const QDate &reference);
} // namespace recognizers

// Priority order of the date grammar classes. First match wins.
const std::vector<NamedRecognizer> &dateRecognizers();

// Month number for a full or three letter month name, 0 when unknown.
int monthFromName(const QString &name);

// Next date with the given month and day on or after reference, looking
// forward year by year for dates like Feb 29. Invalid when no year fits.
QDate nextMonthDay(int month, int day, const QDate &reference);

std::optional<QDate> parseDate(const QString &text, const QDate &reference, ParseError *error = nullptr);
std::optional<QTime> parseTime(const QString &text, ParseError *error = nullptr);
std::optional<QDateTime> parseDateTime(const QString &text,
                                       const QDate &reference,
                                       TimeRequirement requirement = TimeRequirement::Optional,
                                       ParseError *error = nullptr);

} // namespace core
} // namespace agenda
