#include "agenda/cli/CommandLine.hpp"

#include "agenda/cli/TextPrinter.hpp"
#include "agenda/core/AppContext.hpp"
#include "agenda/core/DateExpressionParser.hpp"
#include "agenda/core/Logging.hpp"
#include "agenda/core/Recurrence.hpp"
#include "agenda/core/SyncRunner.hpp"
#include "agenda/data/EventRepository.hpp"
#include "agenda/ui/viewmodels/ScheduleViewModel.hpp"

#include "version.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QTextStream>

namespace agenda {
namespace cli {

namespace {
QCommandLineOption calendarOption(const QString &description)
{
    return QCommandLineOption(QStringList{QStringLiteral("c"), QStringLiteral("calendar")},
                              description,
                              QStringLiteral("calendar"));
}

std::optional<int> parseCount(const QString &text)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}
} // namespace

CommandLine::CommandLine(core::AppContext &context, QTextStream &out, QTextStream &err, QTextStream &in, const QDate &today)
    : m_context(context)
    , m_out(out)
    , m_err(err)
    , m_in(in)
    , m_today(today)
{
}

QString CommandLine::usage()
{
    return QStringLiteral(
        "Usage: agenda [--verbose] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  list [terms...]    List upcoming events\n"
        "  add <name...>      Add an event (-a <date>@<time> is required)\n"
        "  edit <id>          Change fields of an event\n"
        "  delete <id>        Delete an event\n"
        "  show <id>          Show the details of an event\n"
        "  view [date]        Show a day, week or month (default command)\n"
        "  calendars          List the calendars\n"
        "  sync               Run the synchronization tool\n"
        "\n"
        "Dates: 2024-07-14, 14/07/2024, 14-07, tom, 3d, friday, jul, jul-2025, 14-jul.\n"
        "Times follow '@': tom@14, fri@9:30, 14-07@12:30:00.\n"
        "Run 'agenda <command> --help' for the options of a command.\n");
}

int CommandLine::run(QStringList arguments)
{
    arguments.removeAll(QStringLiteral("--verbose"));
    if (!arguments.isEmpty()) {
        arguments.removeFirst();
    }

    QString command = QStringLiteral("view");
    if (!arguments.isEmpty() && !arguments.first().startsWith(QLatin1Char('-'))) {
        command = arguments.takeFirst();
    } else if (!arguments.isEmpty()) {
        const QString &first = arguments.first();
        if (first == QLatin1String("-h") || first == QLatin1String("--help")) {
            m_out << usage();
            m_out.flush();
            return ExitSuccess;
        }
        if (first == QLatin1String("--version")) {
            m_out << "agenda " << AgendaVersion << '\n';
            m_out.flush();
            return ExitSuccess;
        }
    }

    qCDebug(AGENDA_CLI_LOG) << "running" << command << arguments;

    const QStringList commandArguments = QStringList{QStringLiteral("agenda ") + command} + arguments;
    if (command == QLatin1String("list")) {
        return runList(commandArguments);
    }
    if (command == QLatin1String("add")) {
        return runAdd(commandArguments);
    }
    if (command == QLatin1String("edit")) {
        return runEdit(commandArguments);
    }
    if (command == QLatin1String("delete")) {
        return runDelete(commandArguments);
    }
    if (command == QLatin1String("show")) {
        return runShow(commandArguments);
    }
    if (command == QLatin1String("view")) {
        return runView(commandArguments);
    }
    if (command == QLatin1String("calendars")) {
        return runCalendars(commandArguments);
    }
    if (command == QLatin1String("sync")) {
        return runSync(commandArguments);
    }
    if (command == QLatin1String("help")) {
        m_out << usage();
        m_out.flush();
        return ExitSuccess;
    }

    m_err << "Unknown command '" << command << "'\n\n" << usage();
    m_err.flush();
    return ExitUserError;
}

bool CommandLine::parseOptions(QCommandLineParser &parser, const QStringList &arguments, int &exitCode)
{
    const QCommandLineOption helpOption(QStringList{QStringLiteral("h"), QStringLiteral("help")},
                                        QStringLiteral("Displays help for this command."));
    parser.addOption(helpOption);

    if (!parser.parse(arguments)) {
        exitCode = userError(parser.errorText());
        return false;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        m_out.flush();
        exitCode = ExitSuccess;
        return false;
    }
    return true;
}

int CommandLine::runList(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("List the occurrences of events in a date range."));
    parser.addPositionalArgument(QStringLiteral("terms"), QStringLiteral("Words that must appear in the event."), QStringLiteral("[terms...]"));
    const QCommandLineOption calendar = calendarOption(QStringLiteral("Only list this calendar (default: all)."));
    const QCommandLineOption from(QStringList{QStringLiteral("f"), QStringLiteral("from")},
                                  QStringLiteral("First day to list (default: today)."),
                                  QStringLiteral("date"));
    const QCommandLineOption to(QStringList{QStringLiteral("t"), QStringLiteral("to")},
                                QStringLiteral("Last day to list."),
                                QStringLiteral("date"));
    const QCommandLineOption limit(QStringList{QStringLiteral("l"), QStringLiteral("limit")},
                                   QStringLiteral("Print at most this many occurrences."),
                                   QStringLiteral("count"));
    const QCommandLineOption showIds(QStringList{QStringLiteral("i"), QStringLiteral("id")},
                                     QStringLiteral("Print event ids."));
    parser.addOptions({calendar, from, to, limit, showIds});

    int exitCode = ExitSuccess;
    if (!parseOptions(parser, arguments, exitCode)) {
        return exitCode;
    }

    core::ParseError parseError;
    QDate first = m_today;
    if (parser.isSet(from)) {
        const std::optional<QDate> date = core::parseDate(parser.value(from), m_today, &parseError);
        if (!date) {
            return parseFailure(parseError);
        }
        first = *date;
    }
    QDate last = first.addDays(m_context.settings().listHorizonDays);
    if (parser.isSet(to)) {
        const std::optional<QDate> date = core::parseDate(parser.value(to), m_today, &parseError);
        if (!date) {
            return parseFailure(parseError);
        }
        last = *date;
    }
    if (last < first) {
        return userError(QStringLiteral("the end of the range (%1) is before its start (%2)")
                             .arg(last.toString(Qt::ISODate), first.toString(Qt::ISODate)));
    }

    int maximum = -1;
    if (parser.isSet(limit)) {
        const std::optional<int> count = parseCount(parser.value(limit));
        if (!count || *count < 0) {
            return userError(QStringLiteral("invalid limit '%1'").arg(parser.value(limit)));
        }
        maximum = *count;
    }

    ui::ScheduleViewModel schedule(m_context.eventRepository());
    schedule.setRange(first, last);
    schedule.setCalendar(parser.value(calendar));
    schedule.setTerms(parser.positionalArguments());

    data::StoreError storeError;
    if (!schedule.refresh(&storeError)) {
        return storeFailure(storeError);
    }

    std::vector<data::EventInstance> instances = schedule.instances();
    if (maximum >= 0 && instances.size() > static_cast<std::size_t>(maximum)) {
        instances.resize(static_cast<std::size_t>(maximum));
    }
    if (instances.empty()) {
        m_out << "No events found\n";
        m_out.flush();
        return ExitSuccess;
    }

    TextPrinter printer(m_out);
    printer.printInstances(instances, parser.isSet(showIds));
    return ExitSuccess;
}

int CommandLine::runAdd(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Add an event."));
    parser.addPositionalArgument(QStringLiteral("name"), QStringLiteral("Name of the event."), QStringLiteral("<name...>"));
    const QCommandLineOption at(QStringList{QStringLiteral("a"), QStringLiteral("at")},
                                QStringLiteral("Start, e.g. tom@21, 14-jul@12:30, 2024/08/06@08:00."),
                                QStringLiteral("datetime"));
    const QCommandLineOption to(QStringList{QStringLiteral("t"), QStringLiteral("to")},
                                QStringLiteral("End (default: one hour after the start)."),
                                QStringLiteral("datetime"));
    const QCommandLineOption calendar = calendarOption(QStringLiteral("Calendar to add the event to."));
    const QCommandLineOption location(QStringList{QStringLiteral("l"), QStringLiteral("loc")},
                                      QStringLiteral("Location."),
                                      QStringLiteral("text"));
    const QCommandLineOption description(QStringList{QStringLiteral("d"), QStringLiteral("desc")},
                                         QStringLiteral("Description."),
                                         QStringLiteral("text"));
    const QCommandLineOption repeat(QStringList{QStringLiteral("r"), QStringLiteral("repeat")},
                                    QStringLiteral("Repeat daily, weekly, monthly or yearly."),
                                    QStringLiteral("frequency"));
    const QCommandLineOption every(QStringList{QStringLiteral("e"), QStringLiteral("every")},
                                   QStringLiteral("Repeat every N days, weeks, months or years."),
                                   QStringLiteral("N"));
    const QCommandLineOption until(QStringList{QStringLiteral("u"), QStringLiteral("until")},
                                   QStringLiteral("Last day of the repetition."),
                                   QStringLiteral("date"));
    parser.addOptions({at, to, calendar, location, description, repeat, every, until});

    int exitCode = ExitSuccess;
    if (!parseOptions(parser, arguments, exitCode)) {
        return exitCode;
    }

    if (!parser.isSet(at)) {
        return userError(QStringLiteral("an event needs a start, e.g. --at tom@14"));
    }
    if (!parser.isSet(repeat) && (parser.isSet(every) || parser.isSet(until))) {
        return userError(QStringLiteral("--every and --until need --repeat"));
    }

    data::EventRecord event;
    event.calendar = calendarOrDefault(parser.value(calendar));
    event.name = parser.positionalArguments().join(QLatin1Char(' ')).trimmed();
    event.location = parser.value(location);
    event.description = parser.value(description);

    core::ParseError parseError;
    const std::optional<QDateTime> start =
        core::parseDateTime(parser.value(at), m_today, core::TimeRequirement::Required, &parseError);
    if (!start) {
        return parseFailure(parseError);
    }
    event.start = *start;
    event.end = start->addSecs(data::DefaultDurationSecs);
    if (parser.isSet(to)) {
        const std::optional<QDateTime> end =
            core::parseDateTime(parser.value(to), m_today, core::TimeRequirement::Optional, &parseError);
        if (!end) {
            return parseFailure(parseError);
        }
        event.end = *end;
    }

    if (parser.isSet(repeat)) {
        const std::optional<core::Frequency> frequency = core::frequencyFromName(parser.value(repeat));
        if (!frequency) {
            return userError(QStringLiteral("unknown repeat frequency '%1' (expected daily, weekly, monthly or yearly)")
                                 .arg(parser.value(repeat)));
        }
        core::RecurrenceRule rule;
        rule.frequency = *frequency;
        if (parser.isSet(every)) {
            const std::optional<int> interval = parseCount(parser.value(every));
            if (!interval) {
                return userError(QStringLiteral("invalid interval '%1'").arg(parser.value(every)));
            }
            rule.interval = *interval;
        }
        if (parser.isSet(until)) {
            const std::optional<QDate> date = core::parseDate(parser.value(until), m_today, &parseError);
            if (!date) {
                return parseFailure(parseError);
            }
            rule.until = *date;
        }
        event.recurrence = rule;
    }

    data::StoreError storeError;
    const std::optional<data::EventRecord> stored = m_context.eventRepository().addEvent(event, &storeError);
    if (!stored) {
        return storeFailure(storeError);
    }

    m_out << "Added '" << stored->name << "' to " << stored->calendar << " with id " << stored->id << '\n';
    m_out.flush();
    return ExitSuccess;
}

int CommandLine::runEdit(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Change fields of an event. Fields not given are kept."));
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Id of the event."), QStringLiteral("<id>"));
    const QCommandLineOption calendar = calendarOption(QStringLiteral("Calendar holding the event."));
    const QCommandLineOption name(QStringList{QStringLiteral("n"), QStringLiteral("name")},
                                  QStringLiteral("New name."),
                                  QStringLiteral("text"));
    const QCommandLineOption at(QStringList{QStringLiteral("a"), QStringLiteral("at")},
                                QStringLiteral("New start."),
                                QStringLiteral("datetime"));
    const QCommandLineOption to(QStringList{QStringLiteral("t"), QStringLiteral("to")},
                                QStringLiteral("New end."),
                                QStringLiteral("datetime"));
    const QCommandLineOption location(QStringList{QStringLiteral("l"), QStringLiteral("loc")},
                                      QStringLiteral("New location."),
                                      QStringLiteral("text"));
    const QCommandLineOption description(QStringList{QStringLiteral("d"), QStringLiteral("desc")},
                                         QStringLiteral("New description."),
                                         QStringLiteral("text"));
    const QCommandLineOption repeat(QStringList{QStringLiteral("r"), QStringLiteral("repeat")},
                                    QStringLiteral("New frequency, or 'none' to stop repeating."),
                                    QStringLiteral("frequency"));
    const QCommandLineOption every(QStringList{QStringLiteral("e"), QStringLiteral("every")},
                                   QStringLiteral("New repeat interval."),
                                   QStringLiteral("N"));
    const QCommandLineOption until(QStringList{QStringLiteral("u"), QStringLiteral("until")},
                                   QStringLiteral("New last day of the repetition."),
                                   QStringLiteral("date"));
    parser.addOptions({calendar, name, at, to, location, description, repeat, every, until});

    int exitCode = ExitSuccess;
    if (!parseOptions(parser, arguments, exitCode)) {
        return exitCode;
    }
    if (parser.positionalArguments().size() != 1) {
        return userError(QStringLiteral("edit needs exactly one event id"));
    }

    const QString id = parser.positionalArguments().first();
    const QString calendarName = calendarOrDefault(parser.value(calendar));
    data::EventRepository &repository = m_context.eventRepository();

    data::EventPatch patch;
    if (parser.isSet(name)) {
        patch.name = parser.value(name);
    }
    if (parser.isSet(location)) {
        patch.location = parser.value(location);
    }
    if (parser.isSet(description)) {
        patch.description = parser.value(description);
    }

    core::ParseError parseError;
    if (parser.isSet(at)) {
        const std::optional<QDateTime> start =
            core::parseDateTime(parser.value(at), m_today, core::TimeRequirement::Required, &parseError);
        if (!start) {
            return parseFailure(parseError);
        }
        patch.start = *start;
    }
    if (parser.isSet(to)) {
        const std::optional<QDateTime> end =
            core::parseDateTime(parser.value(to), m_today, core::TimeRequirement::Optional, &parseError);
        if (!end) {
            return parseFailure(parseError);
        }
        patch.end = *end;
    }

    const bool clearRepeat = parser.isSet(repeat) && parser.value(repeat).trimmed().toLower() == QLatin1String("none");
    if (clearRepeat) {
        if (parser.isSet(every) || parser.isSet(until)) {
            return userError(QStringLiteral("--every and --until cannot be combined with --repeat none"));
        }
        patch.clearRecurrence = true;
    } else if (parser.isSet(repeat) || parser.isSet(every) || parser.isSet(until)) {
        std::optional<core::Frequency> frequency;
        if (parser.isSet(repeat)) {
            frequency = core::frequencyFromName(parser.value(repeat));
            if (!frequency) {
                return userError(QStringLiteral("unknown repeat frequency '%1' (expected daily, weekly, monthly, yearly or none)")
                                     .arg(parser.value(repeat)));
            }
        }

        data::StoreError storeError;
        const std::optional<data::EventRecord> existing = repository.findById(calendarName, id, &storeError);
        if (!existing) {
            return storeFailure(storeError);
        }
        if (!existing->recurrence && !frequency) {
            return userError(QStringLiteral("'%1' does not repeat; pass --repeat to make it recurring").arg(existing->name));
        }

        // Options not given keep their stored values.
        core::RecurrenceRule rule = existing->recurrence.value_or(core::RecurrenceRule());
        if (frequency) {
            rule.frequency = *frequency;
        }
        if (parser.isSet(every)) {
            const std::optional<int> interval = parseCount(parser.value(every));
            if (!interval) {
                return userError(QStringLiteral("invalid interval '%1'").arg(parser.value(every)));
            }
            rule.interval = *interval;
        }
        if (parser.isSet(until)) {
            const std::optional<QDate> date = core::parseDate(parser.value(until), m_today, &parseError);
            if (!date) {
                return parseFailure(parseError);
            }
            rule.until = *date;
        }
        patch.recurrence = rule;
    }

    data::StoreError storeError;
    const std::optional<data::EventRecord> updated = repository.updateEvent(calendarName, id, patch, &storeError);
    if (!updated) {
        return storeFailure(storeError);
    }

    if (patch.isEmpty()) {
        m_out << "Nothing to change\n";
    } else {
        m_out << "Updated '" << updated->name << "' (" << updated->id << ")\n";
    }
    m_out.flush();
    return ExitSuccess;
}

int CommandLine::runDelete(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Delete an event and all of its occurrences."));
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Id of the event."), QStringLiteral("<id>"));
    const QCommandLineOption calendar = calendarOption(QStringLiteral("Calendar holding the event."));
    const QCommandLineOption force(QStringList{QStringLiteral("f"), QStringLiteral("force")},
                                   QStringLiteral("Delete without asking."));
    parser.addOptions({calendar, force});

    int exitCode = ExitSuccess;
    if (!parseOptions(parser, arguments, exitCode)) {
        return exitCode;
    }
    if (parser.positionalArguments().size() != 1) {
        return userError(QStringLiteral("delete needs exactly one event id"));
    }

    const QString id = parser.positionalArguments().first();
    const QString calendarName = calendarOrDefault(parser.value(calendar));
    data::EventRepository &repository = m_context.eventRepository();

    data::StoreError storeError;
    if (!parser.isSet(force)) {
        const std::optional<data::EventRecord> event = repository.findById(calendarName, id, &storeError);
        if (!event) {
            return storeFailure(storeError);
        }
        TextPrinter printer(m_out);
        printer.printDeletionSummary(*event);
        m_out << "Are you sure? (y/N) ";
        m_out.flush();

        const QString answer = m_in.readLine().trimmed().toLower();
        if (answer != QLatin1String("y") && answer != QLatin1String("yes")) {
            m_out << "Deletion cancelled\n";
            m_out.flush();
            return ExitSuccess;
        }
    }

    if (!repository.removeEvent(calendarName, id, &storeError)) {
        return storeFailure(storeError);
    }
    m_out << "Deleted event " << id << '\n';
    m_out.flush();
    return ExitSuccess;
}

int CommandLine::runShow(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Show the details of an event."));
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Id of the event."), QStringLiteral("<id>"));
    const QCommandLineOption calendar = calendarOption(QStringLiteral("Calendar holding the event."));
    parser.addOption(calendar);

    int exitCode = ExitSuccess;
    if (!parseOptions(parser, arguments, exitCode)) {
        return exitCode;
    }
    if (parser.positionalArguments().size() != 1) {
        return userError(QStringLiteral("show needs exactly one event id"));
    }

    data::StoreError storeError;
    const std::optional<data::EventRecord> event =
        m_context.eventRepository().findById(calendarOrDefault(parser.value(calendar)),
                                             parser.positionalArguments().first(),
                                             &storeError);
    if (!event) {
        return storeFailure(storeError);
    }

    TextPrinter printer(m_out);
    printer.printDetails(*event);
    return ExitSuccess;
}

int CommandLine::runView(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Show the events of a day, week or month."));
    parser.addPositionalArgument(QStringLiteral("date"), QStringLiteral("Day to show (default: today)."), QStringLiteral("[date]"));
    const QCommandLineOption mode(QStringList{QStringLiteral("m"), QStringLiteral("mode")},
                                  QStringLiteral("day, week or month (default: month)."),
                                  QStringLiteral("mode"),
                                  QStringLiteral("month"));
    const QCommandLineOption calendar = calendarOption(QStringLiteral("Only show this calendar (default: all)."));
    const QCommandLineOption number(QStringList{QStringLiteral("n"), QStringLiteral("number")},
                                    QStringLiteral("Number of days, weeks or months to show."),
                                    QStringLiteral("count"),
                                    QStringLiteral("1"));
    parser.addOptions({mode, calendar, number});

    int exitCode = ExitSuccess;
    if (!parseOptions(parser, arguments, exitCode)) {
        return exitCode;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        return userError(QStringLiteral("view takes at most one date"));
    }
    QDate anchor = m_today;
    if (!positional.isEmpty()) {
        core::ParseError parseError;
        const std::optional<QDate> date = core::parseDate(positional.first(), m_today, &parseError);
        if (!date) {
            return parseFailure(parseError);
        }
        anchor = *date;
    }

    const std::optional<ui::ViewMode> viewMode = ui::viewModeFromName(parser.value(mode));
    if (!viewMode) {
        return userError(QStringLiteral("unknown view mode '%1' (expected day, week or month)").arg(parser.value(mode)));
    }
    const std::optional<int> count = parseCount(parser.value(number));
    if (!count || *count < 1) {
        return userError(QStringLiteral("invalid count '%1'").arg(parser.value(number)));
    }

    const ui::DateRange range = ui::viewRange(*viewMode, anchor, *count);
    ui::ScheduleViewModel schedule(m_context.eventRepository());
    schedule.setRange(range.first, range.last);
    schedule.setCalendar(parser.value(calendar));

    data::StoreError storeError;
    if (!schedule.refresh(&storeError)) {
        return storeFailure(storeError);
    }

    TextPrinter printer(m_out);
    printer.printDays(schedule.days());
    return ExitSuccess;
}

int CommandLine::runCalendars(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("List the calendars."));

    int exitCode = ExitSuccess;
    if (!parseOptions(parser, arguments, exitCode)) {
        return exitCode;
    }
    if (!parser.positionalArguments().isEmpty()) {
        return userError(QStringLiteral("calendars takes no arguments"));
    }

    data::StoreError storeError;
    const QStringList calendars = m_context.eventRepository().calendars(&storeError);
    if (storeError.isError()) {
        return storeFailure(storeError);
    }

    TextPrinter printer(m_out);
    printer.printCalendars(calendars);
    return ExitSuccess;
}

int CommandLine::runSync(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Synchronize the calendars with the configured tool."));
    const QCommandLineOption calendar = calendarOption(QStringLiteral("Only synchronize this calendar."));
    parser.addOption(calendar);

    int exitCode = ExitSuccess;
    if (!parseOptions(parser, arguments, exitCode)) {
        return exitCode;
    }

    const core::SyncRunner &runner = m_context.syncRunner();
    if (!runner.isAvailable()) {
        m_err << "Error: sync program '" << m_context.settings().syncProgram << "' is not available\n";
        m_err.flush();
        return ExitFatalError;
    }

    QString errorMessage;
    if (!runner.run(parser.value(calendar), &errorMessage)) {
        m_err << "Error: " << errorMessage << '\n';
        m_err.flush();
        return ExitFatalError;
    }
    return ExitSuccess;
}

QString CommandLine::calendarOrDefault(const QString &calendar) const
{
    if (!calendar.isEmpty()) {
        return calendar;
    }
    const QString configured = m_context.settings().defaultCalendar;
    return configured.isEmpty() ? QString::fromLatin1(data::DefaultCalendar) : configured;
}

int CommandLine::userError(const QString &message)
{
    m_err << "Error: " << message << '\n';
    m_err.flush();
    return ExitUserError;
}

int CommandLine::parseFailure(const core::ParseError &error)
{
    return userError(error.message());
}

int CommandLine::storeFailure(const data::StoreError &error)
{
    if (error.kind != data::StoreError::Kind::Io) {
        return userError(error.message);
    }
    m_err << "Error: " << error.message;
    if (!error.path.isEmpty() && !error.message.contains(error.path)) {
        m_err << " (" << error.path << ')';
    }
    m_err << '\n';
    m_err.flush();
    return ExitFatalError;
}

} // namespace cli
} // namespace agenda
