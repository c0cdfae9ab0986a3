#include <QtTest/QtTest>

#include "agenda/data/FileCalendarStorage.hpp"
#include "agenda/data/FileEventRepository.hpp"
#include "agenda/data/InMemoryEventRepository.hpp"

#include <memory>

using namespace agenda;
using namespace agenda::data;

namespace {
EventRecord makeEvent(const QString &name, const QDateTime &start, int minutes = 60)
{
    EventRecord event;
    event.name = name;
    event.start = start;
    event.end = start.addSecs(minutes * 60);
    return event;
}

EventQuery januaryQuery()
{
    EventQuery query;
    query.window = core::TimeWindow::forDays(QDate(2024, 1, 1), QDate(2024, 1, 31));
    return query;
}

QStringList namesOf(const std::vector<EventRecord> &events)
{
    QStringList names;
    for (const EventRecord &event : events) {
        names << event.name;
    }
    return names;
}
} // namespace

class FileEventRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();
    void insertThenGet();
    void assignsFreshIds();
    void rejectsInvalidEvents();
    void emptyPatchReturnsStoredRecord();
    void patchRewritesFile();
    void rejectedPatchKeepsFile();
    void listsMixedEventsInOrder();
    void filtersByCalendarAndTerms();
    void removesEvents();
    void removingUnknownIdChangesNothing();
    void corruptFileFailsListing();
    void findsSyncedEventsByUid();
    void inMemoryRepositoryBehavesAlike();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<FileEventRepository> m_repository;
};

void FileEventRepositoryTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_repository = std::make_unique<FileEventRepository>(std::make_shared<FileCalendarStorage>(m_dir->path()));
}

void FileEventRepositoryTest::cleanup()
{
    m_repository.reset();
    m_dir.reset();
}

void FileEventRepositoryTest::insertThenGet()
{
    EventRecord event = makeEvent(QStringLiteral("Dentist"), QDateTime(QDate(2024, 1, 8), QTime(10, 0)), 45);
    event.calendar = QStringLiteral("health");
    event.location = QStringLiteral("Main St. 4, 2nd floor");
    event.description = QStringLiteral("Bring the card;\nask about the bill");
    core::RecurrenceRule rule;
    rule.frequency = core::Frequency::Yearly;
    event.recurrence = rule;

    StoreError error;
    const auto stored = m_repository->addEvent(event, &error);
    QVERIFY(stored.has_value());
    QVERIFY(!error.isError());
    QVERIFY(!stored->id.isEmpty());
    QVERIFY(QFileInfo::exists(m_dir->filePath(QStringLiteral("health/%1.ics").arg(stored->id))));

    const auto fetched = m_repository->findById(QStringLiteral("health"), stored->id, &error);
    QVERIFY(fetched.has_value());
    QCOMPARE(*fetched, *stored);

    event.id = stored->id;
    QCOMPARE(*fetched, event);
}

void FileEventRepositoryTest::assignsFreshIds()
{
    EventRecord event = makeEvent(QStringLiteral("Gym"), QDateTime(QDate(2024, 1, 9), QTime(18, 0)));
    event.id = QStringLiteral("caller-chosen");
    event.calendar.clear();

    const auto first = m_repository->addEvent(event);
    const auto second = m_repository->addEvent(event);
    QVERIFY(first && second);
    QVERIFY(first->id != QStringLiteral("caller-chosen"));
    QVERIFY(first->id != second->id);
    QCOMPARE(first->calendar, QStringLiteral("personal"));
    QVERIFY(!QUuid::fromString(first->id).isNull());
    QCOMPARE(m_repository->calendars(), QStringList{QStringLiteral("personal")});
}

void FileEventRepositoryTest::rejectsInvalidEvents()
{
    StoreError error;
    EventRecord unnamed = makeEvent(QString(), QDateTime(QDate(2024, 1, 9), QTime(18, 0)));
    QVERIFY(!m_repository->addEvent(unnamed, &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::Validation);
    QCOMPARE(error.message, QStringLiteral("event name cannot be empty"));

    EventRecord backwards = makeEvent(QStringLiteral("Backwards"), QDateTime(QDate(2024, 1, 9), QTime(18, 0)), -30);
    QVERIFY(!m_repository->addEvent(backwards, &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::Validation);

    EventRecord hidden = makeEvent(QStringLiteral("Hidden"), QDateTime(QDate(2024, 1, 9), QTime(18, 0)));
    hidden.calendar = QStringLiteral(".secret");
    QVERIFY(!m_repository->addEvent(hidden, &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::Validation);

    QVERIFY(m_repository->calendars().isEmpty());
}

void FileEventRepositoryTest::emptyPatchReturnsStoredRecord()
{
    const auto stored = m_repository->addEvent(makeEvent(QStringLiteral("Call"), QDateTime(QDate(2024, 1, 3), QTime(9, 0))));
    QVERIFY(stored.has_value());

    const QString path = m_dir->filePath(QStringLiteral("personal/%1.ics").arg(stored->id));
    QFile before(path);
    QVERIFY(before.open(QIODevice::ReadOnly));
    const QByteArray content = before.readAll();
    before.close();

    const auto updated = m_repository->updateEvent(QStringLiteral("personal"), stored->id, EventPatch());
    QVERIFY(updated.has_value());
    QCOMPARE(*updated, *stored);

    QFile after(path);
    QVERIFY(after.open(QIODevice::ReadOnly));
    QCOMPARE(after.readAll(), content);
}

void FileEventRepositoryTest::patchRewritesFile()
{
    const auto stored = m_repository->addEvent(makeEvent(QStringLiteral("Call"), QDateTime(QDate(2024, 1, 3), QTime(9, 0))));
    QVERIFY(stored.has_value());

    EventPatch patch;
    patch.name = QStringLiteral("Call with Ana");
    patch.end = QDateTime(QDate(2024, 1, 3), QTime(9, 30));
    StoreError error;
    const auto updated = m_repository->updateEvent(QStringLiteral("personal"), stored->id, patch, &error);
    QVERIFY(updated.has_value());
    QCOMPARE(updated->id, stored->id);
    QCOMPARE(updated->name, QStringLiteral("Call with Ana"));

    const auto fetched = m_repository->findById(QStringLiteral("personal"), stored->id);
    QVERIFY(fetched.has_value());
    QCOMPARE(*fetched, *updated);
    QCOMPARE(fetched->durationSecs(), qint64(30 * 60));
}

void FileEventRepositoryTest::rejectedPatchKeepsFile()
{
    const auto stored = m_repository->addEvent(makeEvent(QStringLiteral("Call"), QDateTime(QDate(2024, 1, 3), QTime(9, 0))));
    QVERIFY(stored.has_value());

    EventPatch patch;
    patch.name = QStringLiteral("Renamed");
    patch.start = QDateTime(QDate(2024, 1, 3), QTime(12, 0));
    StoreError error;
    QVERIFY(!m_repository->updateEvent(QStringLiteral("personal"), stored->id, patch, &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::Validation);

    const auto fetched = m_repository->findById(QStringLiteral("personal"), stored->id);
    QVERIFY(fetched.has_value());
    QCOMPARE(*fetched, *stored);

    QVERIFY(!m_repository->updateEvent(QStringLiteral("personal"), QStringLiteral("missing"), patch, &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::NotFound);
}

void FileEventRepositoryTest::listsMixedEventsInOrder()
{
    EventRecord weekly = makeEvent(QStringLiteral("Weekly review"), QDateTime(QDate(2023, 12, 1), QTime(16, 0)));
    core::RecurrenceRule rule;
    rule.frequency = core::Frequency::Weekly;
    weekly.recurrence = rule;
    weekly.calendar = QStringLiteral("work");

    EventRecord monthly = makeEvent(QStringLiteral("Rent"), QDateTime(QDate(2023, 6, 30), QTime(8, 0)), 15);
    rule.frequency = core::Frequency::Monthly;
    monthly.recurrence = rule;

    QVERIFY(m_repository->addEvent(makeEvent(QStringLiteral("Concert"), QDateTime(QDate(2024, 1, 20), QTime(20, 0)))));
    QVERIFY(m_repository->addEvent(makeEvent(QStringLiteral("Breakfast"), QDateTime(QDate(2024, 1, 2), QTime(8, 0)))));
    QVERIFY(m_repository->addEvent(weekly));
    QVERIFY(m_repository->addEvent(monthly));
    QVERIFY(m_repository->addEvent(makeEvent(QStringLiteral("Last year"), QDateTime(QDate(2023, 12, 24), QTime(18, 0)))));

    StoreError error;
    const auto events = m_repository->fetchEvents(januaryQuery(), &error);
    QVERIFY(!error.isError());
    // Breakfast Jan 2, Weekly review Jan 5 (first Friday), Concert Jan 20,
    // Rent Jan 30 (June 30 plus seven months).
    QCOMPARE(namesOf(events),
             (QStringList{QStringLiteral("Breakfast"), QStringLiteral("Weekly review"), QStringLiteral("Concert"), QStringLiteral("Rent")}));
}

void FileEventRepositoryTest::filtersByCalendarAndTerms()
{
    EventRecord work = makeEvent(QStringLiteral("Planning"), QDateTime(QDate(2024, 1, 10), QTime(9, 0)));
    work.calendar = QStringLiteral("work");
    work.location = QStringLiteral("Room 2");
    QVERIFY(m_repository->addEvent(work));
    QVERIFY(m_repository->addEvent(makeEvent(QStringLiteral("Planning dinner"), QDateTime(QDate(2024, 1, 11), QTime(19, 0)))));

    EventQuery query = januaryQuery();
    query.calendar = QStringLiteral("work");
    QCOMPARE(namesOf(m_repository->fetchEvents(query)), QStringList{QStringLiteral("Planning")});

    query.calendar.clear();
    query.terms = QStringList{QStringLiteral("planning")};
    QCOMPARE(m_repository->fetchEvents(query).size(), static_cast<size_t>(2));

    query.terms << QStringLiteral("room");
    QCOMPARE(namesOf(m_repository->fetchEvents(query)), QStringList{QStringLiteral("Planning")});

    StoreError error;
    query.calendar = QStringLiteral("nope");
    QVERIFY(m_repository->fetchEvents(query, &error).empty());
    QCOMPARE(error.kind, StoreError::Kind::NotFound);
}

void FileEventRepositoryTest::removesEvents()
{
    const auto stored = m_repository->addEvent(makeEvent(QStringLiteral("Call"), QDateTime(QDate(2024, 1, 3), QTime(9, 0))));
    QVERIFY(stored.has_value());

    StoreError error;
    QVERIFY(m_repository->removeEvent(QStringLiteral("personal"), stored->id, &error));
    QVERIFY(!m_repository->findById(QStringLiteral("personal"), stored->id, &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::NotFound);
    QVERIFY(m_repository->fetchEvents(januaryQuery()).empty());
}

void FileEventRepositoryTest::removingUnknownIdChangesNothing()
{
    QVERIFY(m_repository->addEvent(makeEvent(QStringLiteral("Call"), QDateTime(QDate(2024, 1, 3), QTime(9, 0)))));
    const QStringList before = QDir(m_dir->filePath(QStringLiteral("personal"))).entryList(QDir::Files);

    StoreError error;
    QVERIFY(!m_repository->removeEvent(QStringLiteral("personal"), QStringLiteral("no-such-id"), &error));
    QCOMPARE(error.kind, StoreError::Kind::NotFound);
    QCOMPARE(error.message, QStringLiteral("no such event 'no-such-id' in calendar 'personal'"));

    QCOMPARE(QDir(m_dir->filePath(QStringLiteral("personal"))).entryList(QDir::Files), before);
}

void FileEventRepositoryTest::corruptFileFailsListing()
{
    QVERIFY(m_repository->addEvent(makeEvent(QStringLiteral("Call"), QDateTime(QDate(2024, 1, 3), QTime(9, 0)))));
    QFile broken(m_dir->filePath(QStringLiteral("personal/broken.ics")));
    QVERIFY(broken.open(QIODevice::WriteOnly));
    broken.write("BEGIN:VEVENT\nSUMMARY:No start\nEND:VEVENT\n");
    broken.close();

    StoreError error;
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("corrupt event file: missing DTSTART")));
    QVERIFY(m_repository->fetchEvents(januaryQuery(), &error).empty());
    QCOMPARE(error.kind, StoreError::Kind::Io);
    QCOMPARE(error.path, broken.fileName());
}

void FileEventRepositoryTest::findsSyncedEventsByUid()
{
    QVERIFY(QDir(m_dir->path()).mkpath(QStringLiteral("personal")));
    const QString path = m_dir->filePath(QStringLiteral("personal/abc.ics"));
    QFile synced(path);
    QVERIFY(synced.open(QIODevice::WriteOnly));
    synced.write("BEGIN:VCALENDAR\r\n"
                 "BEGIN:VEVENT\r\n"
                 "UID:x@y\r\n"
                 "DTSTART:20240105T180000\r\n"
                 "DTEND:20240105T190000\r\n"
                 "SUMMARY:Choir\r\n"
                 "END:VEVENT\r\n"
                 "END:VCALENDAR\r\n");
    synced.close();

    const std::vector<EventRecord> listed = m_repository->fetchEvents(januaryQuery());
    QCOMPARE(listed.size(), static_cast<size_t>(1));
    const QString id = listed.front().id;
    QCOMPARE(id, QStringLiteral("x@y"));

    const auto found = m_repository->findById(QStringLiteral("personal"), id);
    QVERIFY(found.has_value());
    QCOMPARE(found->name, QStringLiteral("Choir"));

    EventPatch patch;
    patch.location = QStringLiteral("Church hall");
    const auto updated = m_repository->updateEvent(QStringLiteral("personal"), id, patch);
    QVERIFY(updated.has_value());
    QCOMPARE(updated->location, QStringLiteral("Church hall"));
    QCOMPARE(m_repository->findById(QStringLiteral("personal"), id)->location, QStringLiteral("Church hall"));
    QVERIFY(QFile::exists(path));

    QVERIFY(m_repository->removeEvent(QStringLiteral("personal"), id));
    QVERIFY(!QFile::exists(path));

    StoreError error;
    QVERIFY(!m_repository->findById(QStringLiteral("personal"), id, &error));
    QCOMPARE(error.kind, StoreError::Kind::NotFound);
}

void FileEventRepositoryTest::inMemoryRepositoryBehavesAlike()
{
    InMemoryEventRepository repository;
    EventRecord event = makeEvent(QStringLiteral("Call"), QDateTime(QDate(2024, 1, 3), QTime(9, 0)));
    event.calendar = QStringLiteral("work");

    const auto stored = repository.addEvent(event);
    QVERIFY(stored.has_value());
    QCOMPARE(repository.calendars(), QStringList{QStringLiteral("work")});
    QCOMPARE(*repository.findById(QStringLiteral("work"), stored->id), *stored);
    QCOMPARE(*repository.updateEvent(QStringLiteral("work"), stored->id, EventPatch()), *stored);

    StoreError error;
    QVERIFY(!repository.findById(QStringLiteral("personal"), stored->id, &error).has_value());
    QCOMPARE(error.kind, StoreError::Kind::NotFound);

    QCOMPARE(repository.fetchEvents(januaryQuery()).size(), static_cast<size_t>(1));
    QVERIFY(repository.removeEvent(QStringLiteral("work"), stored->id));
    QVERIFY(!repository.removeEvent(QStringLiteral("work"), stored->id));
}

QTEST_GUILESS_MAIN(FileEventRepositoryTest)
#include "FileEventRepositoryTest.moc"
