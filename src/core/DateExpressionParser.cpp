#include "agenda/core/DateExpressionParser.hpp"

#include "agenda/core/Logging.hpp"

#include <QHash>
#include <QRegularExpression>
#include <QStringList>

namespace agenda {
namespace core {

namespace {
// Feb 29 needs a leap year, so look a little further than one year ahead.
constexpr int MAX_YEARS_AHEAD = 8;

DateMatch matched(const QDate &date)
{
    DateMatch match;
    match.status = MatchStatus::Matched;
    match.date = date;
    return match;
}

DateMatch rejected(ParseError::Kind kind = ParseError::Kind::InvalidDate)
{
    DateMatch match;
    match.status = MatchStatus::Rejected;
    match.error = kind;
    return match;
}

DateMatch checkedDate(int year, int month, int day)
{
    if (!QDate::isValid(year, month, day)) {
        return rejected();
    }
    return matched(QDate(year, month, day));
}

DateMatch inferredYear(int month, int day, const QDate &reference)
{
    const QDate date = nextMonthDay(month, day, reference);
    if (!date.isValid()) {
        return rejected();
    }
    return matched(date);
}

const QHash<QString, int> &monthNames()
{
    static const QHash<QString, int> names = {
        {QStringLiteral("jan"), 1},  {QStringLiteral("january"), 1},
        {QStringLiteral("feb"), 2},  {QStringLiteral("february"), 2},
        {QStringLiteral("mar"), 3},  {QStringLiteral("march"), 3},
        {QStringLiteral("apr"), 4},  {QStringLiteral("april"), 4},
        {QStringLiteral("may"), 5},
        {QStringLiteral("jun"), 6},  {QStringLiteral("june"), 6},
        {QStringLiteral("jul"), 7},  {QStringLiteral("july"), 7},
        {QStringLiteral("aug"), 8},  {QStringLiteral("august"), 8},
        {QStringLiteral("sep"), 9},  {QStringLiteral("september"), 9},
        {QStringLiteral("oct"), 10}, {QStringLiteral("october"), 10},
        {QStringLiteral("nov"), 11}, {QStringLiteral("november"), 11},
        {QStringLiteral("dec"), 12}, {QStringLiteral("december"), 12},
    };
    return names;
}

// Qt::DayOfWeek numbering, Monday == 1.
const QHash<QString, int> &weekdayNames()
{
    static const QHash<QString, int> names = {
        {QStringLiteral("mon"), Qt::Monday},    {QStringLiteral("monday"), Qt::Monday},
        {QStringLiteral("tue"), Qt::Tuesday},   {QStringLiteral("tuesday"), Qt::Tuesday},
        {QStringLiteral("wed"), Qt::Wednesday}, {QStringLiteral("wednesday"), Qt::Wednesday},
        {QStringLiteral("thu"), Qt::Thursday},  {QStringLiteral("thursday"), Qt::Thursday},
        {QStringLiteral("fri"), Qt::Friday},    {QStringLiteral("friday"), Qt::Friday},
        {QStringLiteral("sat"), Qt::Saturday},  {QStringLiteral("saturday"), Qt::Saturday},
        {QStringLiteral("sun"), Qt::Sunday},    {QStringLiteral("sunday"), Qt::Sunday},
    };
    return names;
}

void setError(ParseError *error, ParseError::Kind kind, const QString &input)
{
    if (!error) {
        return;
    }
    error->kind = kind;
    error->input = input;
}

} // namespace

QString ParseError::message() const
{
    switch (kind) {
    case Kind::UnrecognizedFormat:
        return QStringLiteral("unrecognized date/time format: '%1'").arg(input);
    case Kind::InvalidDate:
        return QStringLiteral("invalid date: '%1'").arg(input);
    case Kind::InvalidTime:
        return QStringLiteral("invalid time: '%1'").arg(input);
    case Kind::MissingTime:
        return QStringLiteral("missing time in '%1' (expected <date>@<time>, e.g. tom@14)").arg(input);
    case Kind::None:
        break;
    }
    return QString();
}

int monthFromName(const QString &name)
{
    return monthNames().value(name.toLower(), 0);
}

QDate nextMonthDay(int month, int day, const QDate &reference)
{
    // 2000 is a leap year, so this only rejects combinations that never exist.
    if (!QDate::isValid(2000, month, day)) {
        return QDate();
    }
    for (int year = reference.year(); year <= reference.year() + MAX_YEARS_AHEAD; ++year) {
        const QDate candidate(year, month, day);
        if (candidate.isValid() && candidate >= reference) {
            return candidate;
        }
    }
    return QDate();
}

namespace recognizers {

DateMatch fullNumericDate(const QString &text, const QDate &)
{
    static const QRegularExpression yearFirst(QStringLiteral("^(\\d{4})([-/])(\\d{1,2})\\2(\\d{1,2})$"));
    static const QRegularExpression yearLast(QStringLiteral("^(\\d{1,2})([-/])(\\d{1,2})\\2(\\d{4})$"));

    QRegularExpressionMatch match = yearFirst.match(text);
    if (match.hasMatch()) {
        return checkedDate(match.captured(1).toInt(), match.captured(3).toInt(), match.captured(4).toInt());
    }
    match = yearLast.match(text);
    if (match.hasMatch()) {
        return checkedDate(match.captured(4).toInt(), match.captured(3).toInt(), match.captured(1).toInt());
    }
    return {};
}

DateMatch shortNumericDate(const QString &text, const QDate &reference)
{
    static const QRegularExpression dayMonth(QStringLiteral("^(\\d{1,2})[-/](\\d{1,2})$"));

    const QRegularExpressionMatch match = dayMonth.match(text);
    if (!match.hasMatch()) {
        return {};
    }
    return inferredYear(match.captured(2).toInt(), match.captured(1).toInt(), reference);
}

DateMatch relativeKeyword(const QString &text, const QDate &reference)
{
    static const QRegularExpression offset(QStringLiteral("^(\\d+)([dwmy])$"));

    if (text == QLatin1String("yesterday") || text == QLatin1String("yes")) {
        return matched(reference.addDays(-1));
    }
    if (text == QLatin1String("today")) {
        return matched(reference);
    }
    if (text == QLatin1String("tomorrow") || text == QLatin1String("tom")) {
        return matched(reference.addDays(1));
    }

    const QRegularExpressionMatch match = offset.match(text);
    if (!match.hasMatch()) {
        return {};
    }

    bool ok = false;
    const int amount = match.captured(1).toInt(&ok);
    if (!ok) {
        return rejected();
    }

    QDate result;
    switch (match.captured(2).at(0).toLatin1()) {
    case 'd':
        result = reference.addDays(amount);
        break;
    case 'w':
        result = reference.addDays(7 * static_cast<qint64>(amount));
        break;
    case 'm':
        result = reference.addMonths(amount);
        break;
    case 'y':
        result = reference.addYears(amount);
        break;
    default:
        return {};
    }
    if (!result.isValid()) {
        return rejected();
    }
    return matched(result);
}

DateMatch weekdayName(const QString &text, const QDate &reference)
{
    const int target = weekdayNames().value(text, 0);
    if (target == 0) {
        return {};
    }
    int daysAhead = (target - reference.dayOfWeek() + 7) % 7;
    if (daysAhead == 0) {
        daysAhead = 7;
    }
    return matched(reference.addDays(daysAhead));
}

DateMatch monthName(const QString &text, const QDate &reference)
{
    const int month = monthFromName(text);
    if (month == 0) {
        return {};
    }
    int year = reference.year();
    if (reference.month() > month) {
        ++year;
    }
    return matched(QDate(year, month, 1));
}

DateMatch monthWithYear(const QString &text, const QDate &)
{
    static const QRegularExpression monthFirst(QStringLiteral("^([a-z]+)[-/](\\d{4})$"));
    static const QRegularExpression yearFirst(QStringLiteral("^(\\d{4})[-/]([a-z]+)$"));

    int month = 0;
    int year = 0;
    QRegularExpressionMatch match = monthFirst.match(text);
    if (match.hasMatch()) {
        month = monthFromName(match.captured(1));
        year = match.captured(2).toInt();
    } else {
        match = yearFirst.match(text);
        if (!match.hasMatch()) {
            return {};
        }
        year = match.captured(1).toInt();
        month = monthFromName(match.captured(2));
    }
    if (month == 0) {
        return {};
    }
    return checkedDate(year, month, 1);
}

DateMatch dayWithMonthName(const QString &text, const QDate &reference)
{
    static const QRegularExpression dayFirst(QStringLiteral("^(\\d{1,2})[-/]([a-z]+)$"));
    static const QRegularExpression monthFirst(QStringLiteral("^([a-z]+)[-/](\\d{1,2})$"));

    int day = 0;
    int month = 0;
    QRegularExpressionMatch match = dayFirst.match(text);
    if (match.hasMatch()) {
        day = match.captured(1).toInt();
        month = monthFromName(match.captured(2));
    } else {
        match = monthFirst.match(text);
        if (!match.hasMatch()) {
            return {};
        }
        month = monthFromName(match.captured(1));
        day = match.captured(2).toInt();
    }
    if (month == 0) {
        return {};
    }
    return inferredYear(month, day, reference);
}

} // namespace recognizers

const std::vector<NamedRecognizer> &dateRecognizers()
{
    static const std::vector<NamedRecognizer> table = {
        {"full numeric date", &recognizers::fullNumericDate},
        {"short numeric date", &recognizers::shortNumericDate},
        {"relative keyword", &recognizers::relativeKeyword},
        {"weekday name", &recognizers::weekdayName},
        {"month name", &recognizers::monthName},
        {"month with year", &recognizers::monthWithYear},
        {"day with month name", &recognizers::dayWithMonthName},
    };
    return table;
}

std::optional<QDate> parseDate(const QString &text, const QDate &reference, ParseError *error)
{
    const QString normalized = text.trimmed().toLower();
    if (normalized.isEmpty() || !reference.isValid()) {
        setError(error, ParseError::Kind::UnrecognizedFormat, text);
        return std::nullopt;
    }

    for (const NamedRecognizer &recognizer : dateRecognizers()) {
        const DateMatch match = recognizer.recognize(normalized, reference);
        if (match.status == MatchStatus::NoMatch) {
            continue;
        }
        if (match.status == MatchStatus::Rejected) {
            qCDebug(AGENDA_PARSE_LOG) << "rejected" << text << "as" << recognizer.name;
            setError(error, match.error, text);
            return std::nullopt;
        }
        qCDebug(AGENDA_PARSE_LOG) << "resolved" << text << "as" << recognizer.name << "to" << match.date;
        return match.date;
    }

    setError(error, ParseError::Kind::UnrecognizedFormat, text);
    return std::nullopt;
}

std::optional<QTime> parseTime(const QString &text, ParseError *error)
{
    static const QRegularExpression clock(QStringLiteral("^(\\d{1,2}):(\\d{2})(?::(\\d{2}))?$"));
    static const QRegularExpression bareHour(QStringLiteral("^\\d{1,2}$"));

    const QString normalized = text.trimmed();

    int hour = 0;
    int minute = 0;
    int second = 0;
    const QRegularExpressionMatch match = clock.match(normalized);
    if (match.hasMatch()) {
        hour = match.captured(1).toInt();
        minute = match.captured(2).toInt();
        second = match.captured(3).isEmpty() ? 0 : match.captured(3).toInt();
    } else if (bareHour.match(normalized).hasMatch()) {
        hour = normalized.toInt();
    } else {
        setError(error, ParseError::Kind::UnrecognizedFormat, text);
        return std::nullopt;
    }

    if (hour > 23 || minute > 59 || second > 59) {
        setError(error, ParseError::Kind::InvalidTime, text);
        return std::nullopt;
    }
    return QTime(hour, minute, second);
}

std::optional<QDateTime> parseDateTime(const QString &text,
                                       const QDate &reference,
                                       TimeRequirement requirement,
                                       ParseError *error)
{
    const QStringList parts = text.trimmed().split(QLatin1Char('@'));
    if (parts.size() > 2) {
        setError(error, ParseError::Kind::UnrecognizedFormat, text);
        return std::nullopt;
    }

    ParseError partError;
    const std::optional<QDate> date = parseDate(parts.at(0), reference, &partError);
    if (!date) {
        setError(error, partError.kind, text);
        return std::nullopt;
    }

    QTime time(0, 0);
    if (parts.size() == 1) {
        if (requirement == TimeRequirement::Required) {
            setError(error, ParseError::Kind::MissingTime, text);
            return std::nullopt;
        }
    } else {
        if (parts.at(1).trimmed().isEmpty()) {
            setError(error, ParseError::Kind::MissingTime, text);
            return std::nullopt;
        }
        const std::optional<QTime> parsed = parseTime(parts.at(1), &partError);
        if (!parsed) {
            setError(error, partError.kind, text);
            return std::nullopt;
        }
        time = *parsed;
    }

    const QDateTime result(*date, time, Qt::LocalTime);
    if (!result.isValid()) {
        // Wall-clock time skipped by a daylight-saving transition.
        setError(error, ParseError::Kind::InvalidTime, text);
        return std::nullopt;
    }
    return result;
}

} // namespace core
} // namespace agenda
