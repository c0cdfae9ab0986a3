#include "agenda/data/FileCalendarStorage.hpp"

#include "agenda/core/Logging.hpp"
#include "version.h"

#include <QDate>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTime>

#include <algorithm>
#include <utility>

namespace agenda {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto LOCAL_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr auto UTC_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr auto EVENT_SUFFIX = ".ics";
constexpr int MAX_LINE_OCTETS = 75;

QString frequencyToken(core::Frequency frequency)
{
    return core::frequencyName(frequency).toUpper();
}

bool isUtf8Continuation(char byte)
{
    return (static_cast<unsigned char>(byte) & 0xC0) == 0x80;
}
} // namespace

FileCalendarStorage::FileCalendarStorage(QString basePath)
    : m_basePath(std::move(basePath))
{
}

const QString &FileCalendarStorage::basePath() const
{
    return m_basePath;
}

QStringList FileCalendarStorage::calendars(StoreError *error) const
{
    QDir base(m_basePath);
    if (!base.exists()) {
        return {};
    }
    if (!QFileInfo(m_basePath).isReadable()) {
        reportStoreError(error, StoreError::Kind::Io, QStringLiteral("cannot read calendar directory"), m_basePath);
        return {};
    }

    QStringList names;
    const QStringList entries = base.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &entry : entries) {
        if (isValidCalendarName(entry)) {
            names << entry;
        }
    }
    return names;
}

QString FileCalendarStorage::calendarPath(const QString &calendar) const
{
    return QDir(m_basePath).filePath(calendar);
}

bool FileCalendarStorage::calendarExists(const QString &calendar) const
{
    return isValidCalendarName(calendar) && QFileInfo(calendarPath(calendar)).isDir();
}

bool FileCalendarStorage::isValidCalendarName(const QString &calendar)
{
    return !calendar.isEmpty()
        && !calendar.startsWith(QLatin1Char('.'))
        && !calendar.contains(QLatin1Char('/'))
        && !calendar.contains(QLatin1Char('\\'));
}

QStringList FileCalendarStorage::eventFiles(const QString &calendar, StoreError *error) const
{
    if (!calendarExists(calendar)) {
        reportStoreError(error, StoreError::Kind::NotFound, QStringLiteral("no such calendar: %1").arg(calendar));
        return {};
    }
    const QString path = calendarPath(calendar);
    if (!QFileInfo(path).isReadable()) {
        reportStoreError(error, StoreError::Kind::Io, QStringLiteral("cannot read calendar directory"), path);
        return {};
    }

    QStringList files;
    QDirIterator it(path,
                    QStringList() << QStringLiteral("*%1").arg(QLatin1String(EVENT_SUFFIX)),
                    QDir::Files,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files << it.next();
    }
    files.sort();
    return files;
}

QString FileCalendarStorage::findEventFile(const QString &calendar, const QString &id) const
{
    if (id.isEmpty() || !calendarExists(calendar)) {
        return QString();
    }
    if (!id.contains(QLatin1Char('/'))) {
        const QString fileName = id + QLatin1String(EVENT_SUFFIX);
        const QString topLevel = QDir(calendarPath(calendar)).filePath(fileName);
        if (QFileInfo(topLevel).isFile()) {
            return topLevel;
        }

        QDirIterator it(calendarPath(calendar), QStringList() << fileName, QDir::Files, QDirIterator::Subdirectories);
        if (it.hasNext()) {
            return it.next();
        }
    }

    // Sync tools name files after the UID only when it is a safe file name.
    for (const QString &filePath : eventFiles(calendar)) {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            continue;
        }
        const std::optional<EventRecord> event = deserialize(file.readAll(), QFileInfo(filePath).completeBaseName());
        if (event && event->id == id) {
            return filePath;
        }
    }
    return QString();
}

QString FileCalendarStorage::newEventFile(const QString &calendar, const QString &id) const
{
    return QDir(calendarPath(calendar)).filePath(id + QLatin1String(EVENT_SUFFIX));
}

std::optional<EventRecord> FileCalendarStorage::readEvent(const QString &filePath,
                                                          const QString &calendar,
                                                          StoreError *error) const
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        reportStoreError(error,
                         StoreError::Kind::Io,
                         QStringLiteral("cannot read event file: %1").arg(file.errorString()),
                         filePath);
        return std::nullopt;
    }

    QString problem;
    std::optional<EventRecord> event = deserialize(file.readAll(), QFileInfo(filePath).completeBaseName(), &problem);
    if (!event) {
        reportStoreError(error, StoreError::Kind::Io, QStringLiteral("corrupt event file: %1").arg(problem), filePath);
        return std::nullopt;
    }
    event->calendar = calendar;
    return event;
}

bool FileCalendarStorage::writeEvent(const QString &filePath, const EventRecord &event, StoreError *error) const
{
    const QDir dir = QFileInfo(filePath).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        reportStoreError(error, StoreError::Kind::Io, QStringLiteral("cannot create calendar directory"), dir.path());
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        reportStoreError(error,
                         StoreError::Kind::Io,
                         QStringLiteral("cannot write event file: %1").arg(file.errorString()),
                         filePath);
        return false;
    }

    const QByteArray content = serialize(event, QDateTime::currentDateTimeUtc());
    if (file.write(content) != content.size() || !file.commit()) {
        reportStoreError(error,
                         StoreError::Kind::Io,
                         QStringLiteral("cannot write event file: %1").arg(file.errorString()),
                         filePath);
        return false;
    }
    qCDebug(AGENDA_STORE_LOG) << "wrote" << filePath;
    return true;
}

bool FileCalendarStorage::removeEventFile(const QString &filePath, StoreError *error) const
{
    QFile file(filePath);
    if (!file.remove()) {
        reportStoreError(error,
                         StoreError::Kind::Io,
                         QStringLiteral("cannot delete event file: %1").arg(file.errorString()),
                         filePath);
        return false;
    }
    qCDebug(AGENDA_STORE_LOG) << "removed" << filePath;
    return true;
}

QByteArray FileCalendarStorage::serialize(const EventRecord &event, const QDateTime &stamp)
{
    QByteArray out;
    auto append = [&out](const QString &line) {
        out += foldLine(line.toUtf8());
        out += "\r\n";
    };

    append(QStringLiteral("BEGIN:VCALENDAR"));
    append(QStringLiteral("VERSION:2.0"));
    append(QStringLiteral("PRODID:-//agenda//agenda %1//EN").arg(QLatin1String(AgendaVersion)));
    append(QStringLiteral("BEGIN:VEVENT"));
    append(QStringLiteral("UID:") + event.id);
    append(QStringLiteral("DTSTAMP:") + stamp.toUTC().toString(QLatin1String(UTC_DATE_TIME_FORMAT)));
    append(QStringLiteral("DTSTART:") + formatDateTime(event.start));
    append(QStringLiteral("DTEND:") + formatDateTime(event.end));
    append(QStringLiteral("SUMMARY:") + encodeText(event.name));
    if (!event.location.isEmpty()) {
        append(QStringLiteral("LOCATION:") + encodeText(event.location));
    }
    if (!event.description.isEmpty()) {
        append(QStringLiteral("DESCRIPTION:") + encodeText(event.description));
    }
    if (event.recurrence) {
        append(QStringLiteral("RRULE:") + formatRecurrence(*event.recurrence));
    }
    append(QStringLiteral("END:VEVENT"));
    append(QStringLiteral("END:VCALENDAR"));
    return out;
}

std::optional<EventRecord> FileCalendarStorage::deserialize(const QByteArray &content,
                                                            const QString &fallbackId,
                                                            QString *errorMessage)
{
    enum class Section {
        Before,
        Event,
        After
    };

    Section section = Section::Before;
    int nestedDepth = 0; // VALARM and friends inside the VEVENT
    EventRecord event;
    bool hasSummary = false;
    bool hasStart = false;
    bool hasEnd = false;
    QDateTime untilInstant;
    QString failure;

    auto handleLine = [&](const QString &line) {
        if (section == Section::After || !failure.isEmpty()) {
            return;
        }
        if (line.startsWith(QLatin1String("BEGIN:"), Qt::CaseInsensitive)) {
            if (section == Section::Event) {
                ++nestedDepth;
            } else if (line.mid(6).trimmed().compare(QLatin1String("VEVENT"), Qt::CaseInsensitive) == 0) {
                section = Section::Event;
            }
            return;
        }
        if (line.startsWith(QLatin1String("END:"), Qt::CaseInsensitive)) {
            if (section == Section::Event) {
                if (nestedDepth > 0) {
                    --nestedDepth;
                } else {
                    section = Section::After;
                }
            }
            return;
        }
        if (section != Section::Event || nestedDepth > 0) {
            return;
        }

        const int colonIndex = line.indexOf(QLatin1Char(':'));
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(QLatin1Char(';'), 0, 0).toUpper();

        if (name == QLatin1String("UID")) {
            event.id = rawValue.trimmed();
        } else if (name == QLatin1String("SUMMARY")) {
            event.name = decodeText(rawValue);
            hasSummary = true;
        } else if (name == QLatin1String("DESCRIPTION")) {
            event.description = decodeText(rawValue);
        } else if (name == QLatin1String("LOCATION")) {
            event.location = decodeText(rawValue);
        } else if (name == QLatin1String("DTSTART")) {
            event.start = parseDateTime(rawValue.trimmed());
            hasStart = true;
            if (!event.start.isValid()) {
                failure = QStringLiteral("invalid DTSTART '%1'").arg(rawValue);
            }
        } else if (name == QLatin1String("DTEND")) {
            event.end = parseDateTime(rawValue.trimmed());
            hasEnd = true;
            if (!event.end.isValid()) {
                failure = QStringLiteral("invalid DTEND '%1'").arg(rawValue);
            }
        } else if (name == QLatin1String("RRULE")) {
            QString problem;
            event.recurrence = parseRecurrence(rawValue.trimmed(), &problem, &untilInstant);
            if (!event.recurrence) {
                failure = problem;
            }
        }
    };

    const QStringList lines = QString::fromUtf8(content).split(QLatin1Char('\n'));
    QString accumulator;
    bool hasAccumulator = false;
    for (QString line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (!line.isEmpty() && (line.startsWith(QLatin1Char(' ')) || line.startsWith(QLatin1Char('\t')))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    auto fail = [errorMessage](const QString &message) -> std::optional<EventRecord> {
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    };

    if (!failure.isEmpty()) {
        return fail(failure);
    }
    if (section == Section::Before) {
        return fail(QStringLiteral("no VEVENT component"));
    }
    if (section == Section::Event) {
        return fail(QStringLiteral("unterminated VEVENT component"));
    }
    if (!hasSummary) {
        return fail(QStringLiteral("missing SUMMARY"));
    }
    if (!hasStart) {
        return fail(QStringLiteral("missing DTSTART"));
    }
    if (!hasEnd) {
        event.end = event.start.addSecs(DefaultDurationSecs);
    }
    if (event.recurrence && untilInstant.isValid() && event.start.time() > untilInstant.time()) {
        // Occurrences keep the start's wall-clock time, so the last day's one lies past UNTIL.
        event.recurrence->until = untilInstant.date().addDays(-1);
    }
    if (event.id.isEmpty()) {
        event.id = fallbackId;
    }
    return event;
}

QString FileCalendarStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    encoded.replace(QLatin1Char('\\'), QLatin1String("\\\\"));
    encoded.replace(QLatin1Char('\n'), QLatin1String("\\n"));
    encoded.replace(QLatin1Char(','), QLatin1String("\\,"));
    encoded.replace(QLatin1Char(';'), QLatin1String("\\;"));
    return encoded;
}

QString FileCalendarStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != QLatin1Char('\\') || i + 1 == text.size()) {
            decoded += c;
            continue;
        }
        const QChar next = text.at(++i);
        if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
            decoded += QLatin1Char('\n');
        } else if (next == QLatin1Char(',') || next == QLatin1Char(';') || next == QLatin1Char('\\')) {
            decoded += next;
        } else {
            decoded += c;
            decoded += next;
        }
    }
    return decoded;
}

QString FileCalendarStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toLocalTime().toString(QLatin1String(LOCAL_DATE_TIME_FORMAT));
}

QDateTime FileCalendarStorage::parseDateTime(const QString &value)
{
    if (value.length() == 8) {
        const QDate date = QDate::fromString(value, QLatin1String(DATE_FORMAT));
        return date.isValid() ? date.startOfDay() : QDateTime();
    }
    if (value.endsWith(QLatin1Char('Z'))) {
        QDateTime dt = QDateTime::fromString(value, QLatin1String(UTC_DATE_TIME_FORMAT));
        dt.setTimeSpec(Qt::UTC);
        return dt.toLocalTime();
    }
    return QDateTime::fromString(value, QLatin1String(LOCAL_DATE_TIME_FORMAT));
}

QString FileCalendarStorage::formatRecurrence(const core::RecurrenceRule &rule)
{
    QString value = QStringLiteral("FREQ=%1;INTERVAL=%2").arg(frequencyToken(rule.frequency)).arg(rule.interval);
    if (rule.hasUntil()) {
        // Same value type as the floating DTSTART, inclusive of the whole day.
        value += QStringLiteral(";UNTIL=%1T235959").arg(rule.until.toString(QLatin1String(DATE_FORMAT)));
    }
    return value;
}

std::optional<core::RecurrenceRule> FileCalendarStorage::parseRecurrence(const QString &value,
                                                                        QString *errorMessage,
                                                                        QDateTime *untilInstant)
{
    auto fail = [errorMessage](const QString &message) -> std::optional<core::RecurrenceRule> {
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    };

    core::RecurrenceRule rule;
    bool hasFrequency = false;
    const QStringList parts = value.split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int equals = part.indexOf(QLatin1Char('='));
        if (equals <= 0) {
            return fail(QStringLiteral("malformed RRULE part '%1'").arg(part));
        }
        const QString key = part.left(equals).trimmed().toUpper();
        const QString argument = part.mid(equals + 1).trimmed();

        if (key == QLatin1String("FREQ")) {
            const std::optional<core::Frequency> frequency = core::frequencyFromName(argument);
            if (!frequency) {
                return fail(QStringLiteral("unsupported RRULE frequency '%1'").arg(argument));
            }
            rule.frequency = *frequency;
            hasFrequency = true;
        } else if (key == QLatin1String("INTERVAL")) {
            bool ok = false;
            rule.interval = argument.toInt(&ok);
            if (!ok || rule.interval < 1) {
                return fail(QStringLiteral("invalid RRULE interval '%1'").arg(argument));
            }
        } else if (key == QLatin1String("UNTIL")) {
            const QDateTime until = parseDateTime(argument);
            if (!until.isValid()) {
                return fail(QStringLiteral("invalid RRULE until '%1'").arg(argument));
            }
            rule.until = until.date();
            if (untilInstant && argument.length() > 8) {
                *untilInstant = until;
            }
        } else {
            qCWarning(AGENDA_STORE_LOG) << "ignoring unsupported RRULE part" << part;
        }
    }
    if (!hasFrequency) {
        return fail(QStringLiteral("RRULE without FREQ"));
    }
    return rule;
}

QByteArray FileCalendarStorage::foldLine(const QByteArray &line)
{
    if (line.size() <= MAX_LINE_OCTETS) {
        return line;
    }

    QByteArray folded;
    int position = 0;
    int limit = MAX_LINE_OCTETS;
    while (position < line.size()) {
        int chunk = std::min(limit, line.size() - position);
        // Never split a multi-byte UTF-8 sequence.
        while (position + chunk < line.size() && chunk > 1 && isUtf8Continuation(line.at(position + chunk))) {
            --chunk;
        }
        if (position > 0) {
            folded += "\r\n ";
        }
        folded += line.mid(position, chunk);
        position += chunk;
        limit = MAX_LINE_OCTETS - 1; // continuation lines start with a space
    }
    return folded;
}

} // namespace data
} // namespace agenda
