#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QStringList>

#include <optional>

#include "agenda/data/Event.hpp"
#include "agenda/data/StoreError.hpp"

namespace agenda {
namespace data {

// One directory per calendar below the base path, one iCalendar file per
// event named after its id. Event files may sit in nested collection
// directories; new files go to the top level of their calendar.
class FileCalendarStorage
{
public:
    explicit FileCalendarStorage(QString basePath);
    ~FileCalendarStorage() = default;

    const QString &basePath() const;

    QStringList calendars(StoreError *error = nullptr) const;
    QString calendarPath(const QString &calendar) const;
    bool calendarExists(const QString &calendar) const;
    static bool isValidCalendarName(const QString &calendar);

    QStringList eventFiles(const QString &calendar, StoreError *error = nullptr) const;
    // Looks for <id>.ics first, then for a file whose UID is id.
    QString findEventFile(const QString &calendar, const QString &id) const;
    QString newEventFile(const QString &calendar, const QString &id) const;

    std::optional<EventRecord> readEvent(const QString &filePath,
                                         const QString &calendar,
                                         StoreError *error = nullptr) const;
    // Whole-file replacement through a temporary file and rename.
    bool writeEvent(const QString &filePath, const EventRecord &event, StoreError *error = nullptr) const;
    bool removeEventFile(const QString &filePath, StoreError *error = nullptr) const;

    static QByteArray serialize(const EventRecord &event, const QDateTime &stamp);
    static std::optional<EventRecord> deserialize(const QByteArray &content,
                                                  const QString &fallbackId,
                                                  QString *errorMessage = nullptr);

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);
    static QString formatRecurrence(const core::RecurrenceRule &rule);
    // untilInstant receives UNTIL when it carries a time of day.
    static std::optional<core::RecurrenceRule> parseRecurrence(const QString &value,
                                                               QString *errorMessage = nullptr,
                                                               QDateTime *untilInstant = nullptr);
    static QByteArray foldLine(const QByteArray &line);

private:
    QString m_basePath;
};

} // namespace data
} // namespace agenda
