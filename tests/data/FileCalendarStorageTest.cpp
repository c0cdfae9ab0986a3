#include <QtTest/QtTest>

#include "agenda/data/FileCalendarStorage.hpp"

using namespace agenda;
using namespace agenda::data;

namespace {
EventRecord sampleEvent()
{
    EventRecord event;
    event.id = QStringLiteral("3f1c2b7e-8d2a-4a51-9c4e-0a4b6f1d2e33");
    event.name = QStringLiteral("Planning; part 2, with \\backslash");
    event.start = QDateTime(QDate(2024, 1, 8), QTime(10, 0));
    event.end = QDateTime(QDate(2024, 1, 8), QTime(11, 30));
    event.location = QStringLiteral("Café Müller, 2nd floor");
    event.description = QStringLiteral("Agenda:\n- budget\n- hiring, travel; misc\n") + QString(120, QLatin1Char('x'));
    core::RecurrenceRule rule;
    rule.frequency = core::Frequency::Weekly;
    rule.interval = 2;
    rule.until = QDate(2024, 3, 31);
    event.recurrence = rule;
    return event;
}

void writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).path());
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(content), qint64(content.size()));
}
} // namespace

class FileCalendarStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void escapesText();
    void foldsLongLines();
    void foldingKeepsUtf8Intact();
    void serializesEvent();
    void roundTripsEvent();
    void readsForeignFiles();
    void ignoresUnsupportedRecurrenceParts();
    void honoursUntilTimeOfDay();
    void rejectsCorruptContent_data();
    void rejectsCorruptContent();
    void listsCalendars();
    void findsNestedEventFiles();
    void reportsCorruptFilesWithPath();
    void writesAndRemovesFiles();
};

void FileCalendarStorageTest::escapesText()
{
    const QString text = QStringLiteral("a,b;c\\d\ne");
    const QString encoded = FileCalendarStorage::encodeText(text);
    QCOMPARE(encoded, QStringLiteral("a\\,b\\;c\\\\d\\ne"));
    QCOMPARE(FileCalendarStorage::decodeText(encoded), text);

    QCOMPARE(FileCalendarStorage::decodeText(QStringLiteral("one\\Ntwo")), QStringLiteral("one\ntwo"));
    QCOMPARE(FileCalendarStorage::decodeText(QStringLiteral("trailing\\")), QStringLiteral("trailing\\"));
    QCOMPARE(FileCalendarStorage::encodeText(QStringLiteral("crlf\r\nline")), QStringLiteral("crlf\\nline"));
}

void FileCalendarStorageTest::foldsLongLines()
{
    const QByteArray line = "DESCRIPTION:" + QByteArray(200, 'a');
    const QByteArray folded = FileCalendarStorage::foldLine(line);

    const QList<QByteArray> physical = folded.split('\n');
    QVERIFY(physical.size() > 1);
    QByteArray unfolded;
    for (int i = 0; i < physical.size(); ++i) {
        QByteArray part = physical.at(i);
        if (part.endsWith('\r')) {
            part.chop(1);
        }
        QVERIFY(part.size() <= 75);
        if (i > 0) {
            QVERIFY(part.startsWith(' '));
            part.remove(0, 1);
        }
        unfolded += part;
    }
    QCOMPARE(unfolded, line);

    const QByteArray shortLine = "SUMMARY:Lunch";
    QCOMPARE(FileCalendarStorage::foldLine(shortLine), shortLine);
}

void FileCalendarStorageTest::foldingKeepsUtf8Intact()
{
    const QString text = QStringLiteral("SUMMARY:") + QString(100, QChar(0x00E9));
    const QByteArray folded = FileCalendarStorage::foldLine(text.toUtf8());

    QString unfolded;
    const QList<QByteArray> physical = folded.split('\n');
    for (int i = 0; i < physical.size(); ++i) {
        QByteArray part = physical.at(i);
        if (part.endsWith('\r')) {
            part.chop(1);
        }
        QVERIFY(part.size() <= 75);
        if (i > 0) {
            part.remove(0, 1);
        }
        const QString decoded = QString::fromUtf8(part);
        QVERIFY(!decoded.contains(QChar::ReplacementCharacter));
        unfolded += decoded;
    }
    QCOMPARE(unfolded, text);
}

void FileCalendarStorageTest::serializesEvent()
{
    const QDateTime stamp(QDate(2024, 1, 1), QTime(12, 0), Qt::UTC);
    const QByteArray content = FileCalendarStorage::serialize(sampleEvent(), stamp);

    QVERIFY(content.startsWith("BEGIN:VCALENDAR\r\nVERSION:2.0\r\nPRODID:-//agenda//agenda "));
    QVERIFY(content.endsWith("END:VEVENT\r\nEND:VCALENDAR\r\n"));
    QVERIFY(content.contains("\r\nUID:3f1c2b7e-8d2a-4a51-9c4e-0a4b6f1d2e33\r\n"));
    QVERIFY(content.contains("\r\nDTSTAMP:20240101T120000Z\r\n"));
    QVERIFY(content.contains("\r\nDTSTART:20240108T100000\r\n"));
    QVERIFY(content.contains("\r\nDTEND:20240108T113000\r\n"));
    QVERIFY(content.contains("\r\nSUMMARY:Planning\\; part 2\\, with \\\\backslash\r\n"));
    QVERIFY(content.contains("\r\nRRULE:FREQ=WEEKLY;INTERVAL=2;UNTIL=20240331T235959\r\n"));
    QVERIFY(!content.contains("\n\n"));

    EventRecord plain = sampleEvent();
    plain.location.clear();
    plain.description.clear();
    plain.recurrence.reset();
    const QByteArray minimal = FileCalendarStorage::serialize(plain, stamp);
    QVERIFY(!minimal.contains("LOCATION"));
    QVERIFY(!minimal.contains("DESCRIPTION"));
    QVERIFY(!minimal.contains("RRULE"));
}

void FileCalendarStorageTest::roundTripsEvent()
{
    const EventRecord event = sampleEvent();
    const QByteArray content = FileCalendarStorage::serialize(event, QDateTime::currentDateTimeUtc());

    QString problem;
    const auto parsed = FileCalendarStorage::deserialize(content, QStringLiteral("unused"), &problem);
    QVERIFY2(parsed.has_value(), qPrintable(problem));
    QCOMPARE(*parsed, event);
}

void FileCalendarStorageTest::readsForeignFiles()
{
    const QByteArray content =
        "BEGIN:VCALENDAR\n"
        "VERSION:2.0\n"
        "PRODID:-//Example Corp//Calendar//EN\n"
        "BEGIN:VTIMEZONE\n"
        "TZID:Europe/Berlin\n"
        "END:VTIMEZONE\n"
        "BEGIN:VEVENT\n"
        "DTSTART;TZID=Europe/Berlin:20240108T100000\n"
        "SUMMARY;LANGUAGE=en:Dentist\\, again\n"
        "DESCRIPTION:Bring the\n"
        "  insurance card\n"
        "BEGIN:VALARM\n"
        "ACTION:DISPLAY\n"
        "DESCRIPTION:Reminder\n"
        "END:VALARM\n"
        "END:VEVENT\n"
        "END:VCALENDAR\n";

    const auto event = FileCalendarStorage::deserialize(content, QStringLiteral("dentist"));
    QVERIFY(event.has_value());
    QCOMPARE(event->id, QStringLiteral("dentist"));
    QCOMPARE(event->name, QStringLiteral("Dentist, again"));
    QCOMPARE(event->description, QStringLiteral("Bring the insurance card"));
    QCOMPARE(event->start, QDateTime(QDate(2024, 1, 8), QTime(10, 0)));
    QCOMPARE(event->end, QDateTime(QDate(2024, 1, 8), QTime(11, 0)));
    QVERIFY(!event->isRecurring());

    const QByteArray utcAndDate =
        "BEGIN:VCALENDAR\r\n"
        "BEGIN:VEVENT\r\n"
        "UID:holiday@example.com\r\n"
        "SUMMARY:Holiday\r\n"
        "DTSTART;VALUE=DATE:20240501\r\n"
        "DTEND;VALUE=DATE:20240502\r\n"
        "END:VEVENT\r\n"
        "BEGIN:VEVENT\r\n"
        "SUMMARY:Ignored second event\r\n"
        "DTSTART:20240601T090000\r\n"
        "END:VEVENT\r\n"
        "END:VCALENDAR\r\n";
    const auto holiday = FileCalendarStorage::deserialize(utcAndDate, QStringLiteral("fallback"));
    QVERIFY(holiday.has_value());
    QCOMPARE(holiday->id, QStringLiteral("holiday@example.com"));
    QCOMPARE(holiday->name, QStringLiteral("Holiday"));
    QCOMPARE(holiday->start, QDateTime(QDate(2024, 5, 1), QTime(0, 0)));
    QCOMPARE(holiday->durationSecs(), qint64(24 * 3600));

    QCOMPARE(FileCalendarStorage::parseDateTime(QStringLiteral("20240108T090000Z")),
             QDateTime(QDate(2024, 1, 8), QTime(9, 0), Qt::UTC));
    QVERIFY(!FileCalendarStorage::parseDateTime(QStringLiteral("2024-01-08")).isValid());
}

void FileCalendarStorageTest::ignoresUnsupportedRecurrenceParts()
{
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("ignoring unsupported RRULE part.*BYDAY")));
    const auto rule = FileCalendarStorage::parseRecurrence(QStringLiteral("FREQ=MONTHLY;BYDAY=MO"));
    QVERIFY(rule.has_value());
    QCOMPARE(rule->frequency, core::Frequency::Monthly);
    QCOMPARE(rule->interval, 1);
    QVERIFY(!rule->hasUntil());

    const auto until = FileCalendarStorage::parseRecurrence(QStringLiteral("freq=daily;until=20240430"));
    QVERIFY(until.has_value());
    QCOMPARE(until->until, QDate(2024, 4, 30));
}

void FileCalendarStorageTest::honoursUntilTimeOfDay()
{
    const QByteArray head = "BEGIN:VCALENDAR\r\n"
                            "BEGIN:VEVENT\r\n"
                            "UID:choir\r\n"
                            "DTSTART:20240101T180000\r\n"
                            "DTEND:20240101T190000\r\n"
                            "SUMMARY:Choir\r\n";
    const QByteArray tail = "END:VEVENT\r\n"
                            "END:VCALENDAR\r\n";

    // 17:00Z is 18:00 in Berlin, so the last evening still counts.
    auto event = FileCalendarStorage::deserialize(head + "RRULE:FREQ=DAILY;UNTIL=20240105T170000Z\r\n" + tail, QString());
    QVERIFY(event.has_value());
    QCOMPARE(event->recurrence->until, QDate(2024, 1, 5));

    event = FileCalendarStorage::deserialize(head + "RRULE:FREQ=DAILY;UNTIL=20240105T120000Z\r\n" + tail, QString());
    QVERIFY(event.has_value());
    QCOMPARE(event->recurrence->until, QDate(2024, 1, 4));
    const auto instances = instancesIn(*event, core::TimeWindow::forDays(QDate(2024, 1, 1), QDate(2024, 1, 31)));
    QCOMPARE(instances.size(), static_cast<size_t>(4));

    event = FileCalendarStorage::deserialize(head + "RRULE:FREQ=DAILY;UNTIL=20240105\r\n" + tail, QString());
    QVERIFY(event.has_value());
    QCOMPARE(event->recurrence->until, QDate(2024, 1, 5));
}

void FileCalendarStorageTest::rejectsCorruptContent_data()
{
    QTest::addColumn<QByteArray>("content");
    QTest::addColumn<QString>("problem");

    QTest::newRow("empty") << QByteArray() << QStringLiteral("no VEVENT component");
    QTest::newRow("unterminated")
        << QByteArray("BEGIN:VEVENT\nSUMMARY:x\nDTSTART:20240101T100000\n")
        << QStringLiteral("unterminated VEVENT component");
    QTest::newRow("no summary")
        << QByteArray("BEGIN:VEVENT\nDTSTART:20240101T100000\nEND:VEVENT\n")
        << QStringLiteral("missing SUMMARY");
    QTest::newRow("no start")
        << QByteArray("BEGIN:VEVENT\nSUMMARY:x\nEND:VEVENT\n")
        << QStringLiteral("missing DTSTART");
    QTest::newRow("bad start")
        << QByteArray("BEGIN:VEVENT\nSUMMARY:x\nDTSTART:tomorrow\nEND:VEVENT\n")
        << QStringLiteral("invalid DTSTART 'tomorrow'");
    QTest::newRow("bad frequency")
        << QByteArray("BEGIN:VEVENT\nSUMMARY:x\nDTSTART:20240101T100000\nRRULE:FREQ=HOURLY\nEND:VEVENT\n")
        << QStringLiteral("unsupported RRULE frequency 'HOURLY'");
    QTest::newRow("zero interval")
        << QByteArray("BEGIN:VEVENT\nSUMMARY:x\nDTSTART:20240101T100000\nRRULE:FREQ=DAILY;INTERVAL=0\nEND:VEVENT\n")
        << QStringLiteral("invalid RRULE interval '0'");
    QTest::newRow("no frequency")
        << QByteArray("BEGIN:VEVENT\nSUMMARY:x\nDTSTART:20240101T100000\nRRULE:INTERVAL=2\nEND:VEVENT\n")
        << QStringLiteral("RRULE without FREQ");
}

void FileCalendarStorageTest::rejectsCorruptContent()
{
    QFETCH(QByteArray, content);
    QFETCH(QString, problem);

    QString message;
    QVERIFY(!FileCalendarStorage::deserialize(content, QStringLiteral("id"), &message).has_value());
    QCOMPARE(message, problem);
}

void FileCalendarStorageTest::listsCalendars()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QDir base(dir.path());
    QVERIFY(base.mkpath(QStringLiteral("work")));
    QVERIFY(base.mkpath(QStringLiteral("personal")));
    QVERIFY(base.mkpath(QStringLiteral(".vdirsyncer")));
    writeFile(base.filePath(QStringLiteral("stray.ics")), "not a calendar");

    FileCalendarStorage storage(dir.path());
    StoreError error;
    QCOMPARE(storage.calendars(&error), (QStringList{QStringLiteral("personal"), QStringLiteral("work")}));
    QVERIFY(!error.isError());
    QVERIFY(storage.calendarExists(QStringLiteral("work")));
    QVERIFY(!storage.calendarExists(QStringLiteral(".vdirsyncer")));
    QVERIFY(!storage.calendarExists(QStringLiteral("../work")));

    FileCalendarStorage missing(base.filePath(QStringLiteral("does-not-exist")));
    QVERIFY(missing.calendars(&error).isEmpty());
    QVERIFY(!error.isError());
}

void FileCalendarStorageTest::findsNestedEventFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QDir base(dir.path());
    writeFile(base.filePath(QStringLiteral("work/top.ics")), "x");
    writeFile(base.filePath(QStringLiteral("work/collection/nested.ics")), "x");
    writeFile(base.filePath(QStringLiteral("work/notes.txt")), "x");

    FileCalendarStorage storage(dir.path());
    StoreError error;
    const QStringList files = storage.eventFiles(QStringLiteral("work"), &error);
    QVERIFY(!error.isError());
    QCOMPARE(files.size(), 2);

    QCOMPARE(storage.findEventFile(QStringLiteral("work"), QStringLiteral("top")), base.filePath(QStringLiteral("work/top.ics")));
    QCOMPARE(storage.findEventFile(QStringLiteral("work"), QStringLiteral("nested")),
             base.filePath(QStringLiteral("work/collection/nested.ics")));
    QVERIFY(storage.findEventFile(QStringLiteral("work"), QStringLiteral("absent")).isEmpty());
    QVERIFY(storage.findEventFile(QStringLiteral("work"), QStringLiteral("collection/nested")).isEmpty());

    QVERIFY(storage.eventFiles(QStringLiteral("home"), &error).isEmpty());
    QCOMPARE(error.kind, StoreError::Kind::NotFound);
    QCOMPARE(error.message, QStringLiteral("no such calendar: home"));
}

void FileCalendarStorageTest::reportsCorruptFilesWithPath()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("work/broken.ics"));
    writeFile(path, "BEGIN:VEVENT\nDTSTART:20240101T100000\nEND:VEVENT\n");

    FileCalendarStorage storage(dir.path());
    StoreError error;
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("corrupt event file")));
    QVERIFY(!storage.readEvent(path, QStringLiteral("work"), &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::Io);
    QCOMPARE(error.path, path);
    QCOMPARE(error.message, QStringLiteral("corrupt event file: missing SUMMARY"));
}

void FileCalendarStorageTest::writesAndRemovesFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileCalendarStorage storage(dir.path());

    const EventRecord event = sampleEvent();
    const QString path = storage.newEventFile(QStringLiteral("work"), event.id);
    QCOMPARE(QFileInfo(path).fileName(), event.id + QStringLiteral(".ics"));

    StoreError error;
    QVERIFY(storage.writeEvent(path, event, &error));
    QVERIFY(storage.calendarExists(QStringLiteral("work")));

    const auto read = storage.readEvent(path, QStringLiteral("work"), &error);
    QVERIFY(read.has_value());
    QCOMPARE(read->calendar, QStringLiteral("work"));
    QCOMPARE(read->name, event.name);
    QVERIFY(read->recurrence == event.recurrence);

    QVERIFY(storage.removeEventFile(path, &error));
    QVERIFY(!QFileInfo::exists(path));

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("cannot delete event file")));
    QVERIFY(!storage.removeEventFile(path, &error));
    QCOMPARE(error.kind, StoreError::Kind::Io);
}

QTEST_GUILESS_MAIN(FileCalendarStorageTest)
#include "FileCalendarStorageTest.moc"
