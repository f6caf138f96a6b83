#include "../common/test_base.h"

#include "journal/ChainVerifier.hpp"
#include "journal/sqlite/Schema.hpp"
#include "journal/sqlite/SqliteStore.hpp"

#include <QFile>
#include <QtTest>

#include <limits>
#include <vector>

using journal::ErrorCode;
using journal::Event;
using journal::EventFilter;
using journal::Hash;
using journal::Journal;
using journal::sqlite::Database;
using journal::sqlite::FileDatabaseFactory;
using journal::sqlite::SqliteOptions;

/**
 * Integration Test: SQLite journal on disk
 *
 * Covers what only the persistent backend can show: reopening a file, damaged
 * rows, tampered history and the schema bookkeeping.
 */
class TestSqlitePersistence : public TestBase
{
    Q_OBJECT

private slots:
    void initTestCase() override;
    void cleanupTestCase() override;

    void testReopenPreservesRefsAndEvents();
    void testSchemaVersionRecorded();
    void testNewerSchemaRejected();
    void testCorruptRowSkipped();
    void testUnregisteredTypeSkippedByStrictCodec();
    void testTamperedRowDetected();
    void testCorruptRefReported();
    void testDocumentDisagreeingWithColumnsSkipped();
    void testSmallPagesStreamEverything();
    void testCommitAfterForeignSwapConflicts();
    void testOptionsFromEnvironment();
    void testMissingDirectoryFailsToOpen();
    void testReadOnlyReadsWithoutWriting();
    void testReadOnlyRejectsForeignDatabase();

private:
    SqliteOptions freshOptions();
    static EventFilter filterFor(const std::string& aggregateId);
    static void execute(Database& database, const std::string& sql);
    static int countRows(Database& database, const std::string& table);

    int m_fileCounter = 0;
};

void TestSqlitePersistence::initTestCase()
{
    TestBase::initTestCase();
}

void TestSqlitePersistence::cleanupTestCase()
{
    TestBase::cleanupTestCase();
}

SqliteOptions TestSqlitePersistence::freshOptions()
{
    return fileOptions(QString("persist-%1.db").arg(m_fileCounter++));
}

EventFilter TestSqlitePersistence::filterFor(const std::string& aggregateId)
{
    EventFilter filter;
    filter.aggregateId = aggregateId;
    return filter;
}

void TestSqlitePersistence::execute(Database& database, const std::string& sql)
{
    database.withConnection([&](sqlite3* db) { journal::sqlite::exec_sql(db, sql); });
}

int TestSqlitePersistence::countRows(Database& database, const std::string& table)
{
    return database.withConnection([&](sqlite3* db) {
        journal::sqlite::Statement query(db, "SELECT COUNT(*) FROM " + table + ";");
        query.step();
        return static_cast<int>(query.columnInt64(0));
    });
}

void TestSqlitePersistence::testReopenPreservesRefsAndEvents()
{
    const SqliteOptions options = freshOptions();
    Hash head = Hash::zero();
    {
        FileDatabaseFactory factory(options);
        Journal journal = Journal::createPersistent(factory, testCodec());
        const Hash v1 = journal.eventStore().commit("agg", makeEvent("e1", "agg", 1000), Hash::zero());
        head = journal.eventStore().commit("agg", makeEvent("e2", "agg", 2000, v1), v1);
        journal.eventStore().commit("other", makeEvent("o1", "other", 1500), Hash::zero());
    }

    FileDatabaseFactory factory(options);
    Journal reopened = Journal::createPersistent(factory, testCodec());

    QVERIFY(reopened.refStore().read("agg") == head);
    const std::vector<Event> events = reopened.eventStore().events(filterFor("agg"));
    QCOMPARE(int(events.size()), 2);
    QCOMPARE(QString::fromStdString(events[0].id), QString("e1"));
    QVERIFY(events[1].hash() == head);
    QCOMPARE(int(reopened.eventStore().getAllEvents().collect().size()), 3);

    // The chain continues from the persisted head.
    reopened.eventStore().commit("agg", makeEvent("e3", "agg", 3000, head), head);
    QVERIFY(journal::verifyChain(reopened.eventStore(), "agg").ok());
}

void TestSqlitePersistence::testSchemaVersionRecorded()
{
    const SqliteOptions options = freshOptions();
    FileDatabaseFactory factory(options);
    std::shared_ptr<Database> database = factory.createDatabase();

    QCOMPARE(journal::sqlite::schemaVersion(*database), journal::schema::CURRENT_SCHEMA_VERSION);

    // Applying again is harmless.
    journal::sqlite::applySchema(*database);
    QCOMPARE(countRows(*database, journal::schema::SCHEMA_VERSION_TABLE), 1);
}

void TestSqlitePersistence::testNewerSchemaRejected()
{
    const SqliteOptions options = freshOptions();
    {
        FileDatabaseFactory factory(options);
        std::shared_ptr<Database> database = factory.createDatabase();
        execute(*database, "INSERT INTO schema_version(version) VALUES(" +
                               std::to_string(journal::schema::CURRENT_SCHEMA_VERSION + 1) + ");");
    }

    FileDatabaseFactory factory(options);
    QVERIFY(errorCodeOf([&] { factory.createDatabase(); }) == ErrorCode::StorageFailure);
}

void TestSqlitePersistence::testCorruptRowSkipped()
{
    journal::sqlite::MemoryDatabaseFactory factory;
    std::shared_ptr<Database> database = factory.createDatabase();
    Journal journal = Journal::createWithDatabase(database, testCodec());

    const Hash v1 = journal.eventStore().commit("agg", makeEvent("e1", "agg", 1000), Hash::zero());
    const Hash v2 = journal.eventStore().commit("agg", makeEvent("e2", "agg", 2000, v1), v1);
    journal.eventStore().commit("agg", makeEvent("e3", "agg", 3000, v2), v2);

    execute(*database, "UPDATE events SET data = '{not json' WHERE id = 'e2';");

    const std::vector<Event> events = journal.eventStore().events(filterFor("agg"));
    QCOMPARE(int(events.size()), 2);
    QCOMPARE(QString::fromStdString(events[0].id), QString("e1"));
    QCOMPARE(QString::fromStdString(events[1].id), QString("e3"));

    QCOMPARE(int(journal.eventStore().getAllEvents().collect().size()), 2);
}

void TestSqlitePersistence::testUnregisteredTypeSkippedByStrictCodec()
{
    journal::sqlite::MemoryDatabaseFactory factory;
    std::shared_ptr<Database> database = factory.createDatabase();

    // Written by a codec that knows every type, read by one that does not.
    Journal writer = Journal::createWithDatabase(database, journal::EventCodec::permissive());
    const Hash v1 = writer.eventStore().commit("agg", makeEvent("e1", "agg", 1000), Hash::zero());
    writer.eventStore().commit("agg", makeEvent("e2", "agg", 2000, v1, "legacy.type"), v1);

    Journal reader = Journal::createWithDatabase(database, testCodec());
    QCOMPARE(int(reader.eventStore().events(filterFor("agg")).size()), 1);
    QCOMPARE(int(writer.eventStore().events(filterFor("agg")).size()), 2);
}

void TestSqlitePersistence::testTamperedRowDetected()
{
    journal::sqlite::MemoryDatabaseFactory factory;
    std::shared_ptr<Database> database = factory.createDatabase();
    Journal journal = Journal::createWithDatabase(database, testCodec());

    const Hash v1 = journal.eventStore().commit("agg", makeEvent("e1", "agg", 1000), Hash::zero());
    const Hash v2 = journal.eventStore().commit("agg", makeEvent("e2", "agg", 2000, v1), v1);
    journal.eventStore().commit("agg", makeEvent("e3", "agg", 3000, v2), v2);
    QVERIFY(journal::verifyChain(journal.eventStore(), "agg").ok());

    Event forged = makeEvent("e1", "agg", 1000);
    forged.payload = {{"seq", "forged"}};
    const std::string data = journal::EventCodec::permissive()->encode(forged);
    database->withConnection([&](sqlite3* db) {
        journal::sqlite::Statement update(db, "UPDATE events SET data = ? WHERE id = 'e1';");
        update.bind(1, data);
        update.step();
    });

    journal::ChainReport report = journal::verifyChain(journal.eventStore(), "agg");
    QVERIFY(!report.ok());
    QCOMPARE(int(report.eventCount), 3);
}

void TestSqlitePersistence::testDocumentDisagreeingWithColumnsSkipped()
{
    journal::sqlite::MemoryDatabaseFactory factory;
    std::shared_ptr<Database> database = factory.createDatabase();
    Journal journal = Journal::createWithDatabase(database, testCodec());

    const Hash v1 = journal.eventStore().commit("agg", makeEvent("e1", "agg", 1000), Hash::zero());
    const Hash v2 = journal.eventStore().commit("agg", makeEvent("e2", "agg", 2000, v1), v1);
    journal.eventStore().commit("agg", makeEvent("e3", "agg", 3000, v2), v2);
    journal.eventStore().commit("other", makeEvent("o1", "other", 1500), Hash::zero());

    // e2's document claims another aggregate, e3's another type.
    Event movedAggregate = makeEvent("e2", "other", 2000, v1);
    Event changedType = makeEvent("e3", "agg", 3000, v2, "a");
    database->withConnection([&](sqlite3* db) {
        journal::sqlite::Statement update(db, "UPDATE events SET data = ? WHERE id = ?;");
        update.bind(1, journal::EventCodec::permissive()->encode(movedAggregate));
        update.bind(2, std::string("e2"));
        update.step();
        journal::sqlite::Statement retype(db, "UPDATE events SET data = ? WHERE id = ?;");
        retype.bind(1, journal::EventCodec::permissive()->encode(changedType));
        retype.bind(2, std::string("e3"));
        retype.step();
    });

    const std::vector<Event> events = journal.eventStore().events(filterFor("agg"));
    QCOMPARE(int(events.size()), 1);
    QCOMPARE(QString::fromStdString(events[0].id), QString("e1"));

    QCOMPARE(int(journal.eventStore().events(filterFor("other")).size()), 1);

    EventFilter typed = filterFor("agg");
    typed.type = std::string("a");
    QVERIFY(journal.eventStore().events(typed).empty());

    QCOMPARE(int(journal.eventStore().chain("agg").size()), 1);
    QCOMPARE(int(journal.eventStore().getAllEvents().collect().size()), 2);
}

void TestSqlitePersistence::testCorruptRefReported()
{
    journal::sqlite::MemoryDatabaseFactory factory;
    std::shared_ptr<Database> database = factory.createDatabase();
    Journal journal = Journal::createWithDatabase(database, testCodec());
    journal.eventStore().commit("agg", makeEvent("e1", "agg", 1000), Hash::zero());

    execute(*database, "UPDATE refs SET version = '" + std::string(64, 'Z') + "' WHERE aggregate_id = 'agg';");

    QVERIFY(errorCodeOf([&] { journal.refStore().read("agg"); }) == ErrorCode::StorageFailure);
}

void TestSqlitePersistence::testSmallPagesStreamEverything()
{
    SqliteOptions options = freshOptions();
    options.streamPageSize = 2;
    FileDatabaseFactory factory(options);
    Journal journal = Journal::createPersistent(factory, testCodec());

    // Seven events with repeated timestamps so page boundaries split ties.
    const std::vector<std::int64_t> timestamps{500, 500, 500, 100, 900, 100, 500};
    Hash version = Hash::zero();
    for (std::size_t i = 0; i < timestamps.size(); ++i) {
        Event event = makeEvent("e" + std::to_string(i), "agg", timestamps[i],
                                version.isZero() ? std::nullopt : std::optional<Hash>(version));
        version = journal.eventStore().commit("agg", event, version);
    }

    const std::vector<Event> streamed = journal.eventStore().getAllEvents().collect();
    std::vector<std::string> ids;
    for (const Event& event : streamed) {
        ids.push_back(event.id);
    }
    const std::vector<std::string> expected{"e3", "e5", "e0", "e1", "e2", "e6", "e4"};
    QVERIFY(ids == expected);
}

void TestSqlitePersistence::testCommitAfterForeignSwapConflicts()
{
    journal::sqlite::MemoryDatabaseFactory factory;
    std::shared_ptr<Database> database = factory.createDatabase();
    auto store = std::make_shared<journal::sqlite::SqliteStore>(database, testCodec());

    const Hash v1 = store->commit("agg", makeEvent("e1", "agg", 1000), Hash::zero());
    // A bare swap moves the ref away from the last committed event.
    store->swap("agg", someHash("moved"), v1);

    QVERIFY_EXCEPTION_THROWN(store->commit("agg", makeEvent("e2", "agg", 2000, v1), v1),
                             journal::ConcurrencyConflict);
    QCOMPARE(countRows(*database, journal::schema::EVENTS_TABLE), 1);
    QVERIFY(store->read("agg") == someHash("moved"));
}

void TestSqlitePersistence::testOptionsFromEnvironment()
{
    qputenv("JOURNAL_DB_PATH", "/tmp/somewhere.db");
    qputenv("JOURNAL_BUSY_TIMEOUT_MS", "1234");
    qputenv("JOURNAL_STREAM_PAGE_SIZE", "not-a-number");

    const SqliteOptions options = SqliteOptions::fromEnvironment();
    QCOMPARE(QString::fromStdString(options.path), QString("/tmp/somewhere.db"));
    QCOMPARE(options.busyTimeoutMs, 1234);
    QCOMPARE(int(options.streamPageSize), int(SqliteOptions().streamPageSize));

    qunsetenv("JOURNAL_DB_PATH");
    qunsetenv("JOURNAL_BUSY_TIMEOUT_MS");
    qunsetenv("JOURNAL_STREAM_PAGE_SIZE");

    qputenv("JOURNAL_BUSY_TIMEOUT_MS", "3000000000");
    QCOMPARE(SqliteOptions::fromEnvironment().busyTimeoutMs, std::numeric_limits<int>::max());
    qunsetenv("JOURNAL_BUSY_TIMEOUT_MS");

    const SqliteOptions defaults = SqliteOptions::fromEnvironment();
    QCOMPARE(QString::fromStdString(defaults.path), QString(journal::schema::IN_MEMORY_PATH));
}

void TestSqlitePersistence::testMissingDirectoryFailsToOpen()
{
    SqliteOptions options;
    options.path = m_testDataDir->filePath("no/such/dir/journal.db").toStdString();
    FileDatabaseFactory factory(options);

    QVERIFY_EXCEPTION_THROWN(factory.createDatabase(), journal::StorageError);
}

void TestSqlitePersistence::testReadOnlyReadsWithoutWriting()
{
    SqliteOptions options = freshOptions();
    Hash head = Hash::zero();
    {
        FileDatabaseFactory factory(options);
        Journal journal = Journal::createPersistent(factory, testCodec());
        const Hash v1 = journal.eventStore().commit("agg", makeEvent("e1", "agg", 1000), Hash::zero());
        head = journal.eventStore().commit("agg", makeEvent("e2", "agg", 2000, v1), v1);
    }

    options.readOnly = true;
    FileDatabaseFactory factory(options);
    Journal reader = Journal::createPersistent(factory, testCodec());

    QVERIFY(reader.eventStore().head("agg") == head);
    QCOMPARE(int(reader.eventStore().events(filterFor("agg")).size()), 2);
    QVERIFY(journal::verifyChain(reader.eventStore(), "agg").ok());

    QVERIFY_EXCEPTION_THROWN(reader.eventStore().commit("agg", makeEvent("e3", "agg", 3000, head), head),
                             journal::StorageError);
    QVERIFY_EXCEPTION_THROWN(reader.refStore().swap("fresh", someHash("x"), std::nullopt), journal::StorageError);
    QCOMPARE(int(reader.eventStore().getAllEvents().collect().size()), 2);
}

void TestSqlitePersistence::testReadOnlyRejectsForeignDatabase()
{
    SqliteOptions options = freshOptions();
    {
        Database foreign(options);
        execute(foreign, "CREATE TABLE foo (x INTEGER);");
    }

    SqliteOptions readOnly = options;
    readOnly.readOnly = true;
    FileDatabaseFactory factory(readOnly);
    QVERIFY_EXCEPTION_THROWN(Journal::createPersistent(factory, testCodec()), journal::StorageError);

    Database check(options);
    const int journalTables = check.withConnection([](sqlite3* db) {
        journal::sqlite::Statement query(db,
                                         "SELECT COUNT(*) FROM sqlite_master WHERE name IN "
                                         "('events', 'refs', 'schema_version');");
        query.step();
        return static_cast<int>(query.columnInt64(0));
    });
    QCOMPARE(journalTables, 0);
    QCOMPARE(countRows(check, "foo"), 0);

    // A missing file is not created.
    SqliteOptions missing = freshOptions();
    missing.readOnly = true;
    FileDatabaseFactory missingFactory(missing);
    QVERIFY_EXCEPTION_THROWN(missingFactory.createDatabase(), journal::StorageError);
    QVERIFY(!QFile::exists(QString::fromStdString(missing.path)));
}

QTEST_APPLESS_MAIN(TestSqlitePersistence)
#include "test_sqlite_persistence.moc"
