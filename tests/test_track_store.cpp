#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <climits>
#include <filesystem>
#include <fstream>
#include <memory>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/evaluator_config.hpp"
#include "evaluator/sqlite_track_store.hpp"

namespace {

skyshield::TrackRecord makeRecord(const std::string &ref, const std::string &status)
{
    skyshield::TrackRecord record;
    record.externalRef = ref;
    record.x = 100.0;
    record.y = 200.0;
    record.speed = 420.0;
    record.identification = "UNKNOWN";
    record.threatScore = 10;
    record.lifecycleState = status;
    return record;
}

} // namespace

class TrackStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testUpsertAndGet();
    void testFetchOnlyLive();
    void testMalformedColumnsSurface();
    void testCommitAndRollback();
    void testStatusRegressionRefused();
    void testUnreachableStore();
    void testBusyStoreRaisesFetchError();
    void testWideStoredScoreIsBounded();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetDb();
    std::string dbPath() const;
};

void TrackStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void TrackStoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::string TrackStoreTests::dbPath() const
{
    return skyshield::defaultDatabasePath();
}

void TrackStoreTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

void TrackStoreTests::testUpsertAndGet()
{
    resetDb();

    skyshield::SqliteTrackStore store(dbPath());
    std::string message;
    QVERIFY(store.integrityCheck(&message));
    QCOMPARE(QString::fromStdString(message), QStringLiteral("ok"));

    const int64_t id = store.upsertTrack(makeRecord("alpha", "LIVE"));
    QVERIFY(id > 0);

    const auto loaded = store.getTrack(id);
    QVERIFY(loaded.has_value());
    QCOMPARE(QString::fromStdString(loaded->externalRef), QStringLiteral("alpha"));
    QCOMPARE(*loaded->x, 100.0);
    QCOMPARE(*loaded->speed, 420.0);
    QCOMPARE(QString::fromStdString(loaded->identification), QStringLiteral("UNKNOWN"));
    QCOMPARE(loaded->threatScore, 10);

    QVERIFY(!store.getTrack(id + 100).has_value());
}

void TrackStoreTests::testFetchOnlyLive()
{
    resetDb();

    skyshield::SqliteTrackStore store(dbPath());
    store.upsertTrack(makeRecord("live-1", "LIVE"));
    store.upsertTrack(makeRecord("engaged-1", "ENGAGED"));
    store.upsertTrack(makeRecord("live-2", "LIVE"));

    auto session = store.openSession();
    const auto records = session->fetchLiveTracks();
    QCOMPARE(static_cast<int>(records.size()), 2);
    QCOMPARE(QString::fromStdString(records[0].externalRef), QStringLiteral("live-1"));
    QCOMPARE(QString::fromStdString(records[1].externalRef), QStringLiteral("live-2"));
    session->commit();
}

void TrackStoreTests::testMalformedColumnsSurface()
{
    resetDb();

    skyshield::SqliteTrackStore store(dbPath());
    auto record = makeRecord("no-position", "LIVE");
    record.x.reset();
    record.identification = "BOGUS";
    const int64_t id = store.upsertTrack(record);

    auto session = store.openSession();
    const auto records = session->fetchLiveTracks();
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].id, id);
    QVERIFY(!records[0].x.has_value());
    QVERIFY(records[0].y.has_value());
    QCOMPARE(QString::fromStdString(records[0].identification), QStringLiteral("BOGUS"));
}

void TrackStoreTests::testCommitAndRollback()
{
    resetDb();

    skyshield::SqliteTrackStore store(dbPath());
    const int64_t id = store.upsertTrack(makeRecord("bravo", "LIVE"));

    {
        auto session = store.openSession();
        session->persistScore(id, 55);
        session->persistScore(id, 55);
        session->commit();
    }
    QCOMPARE(store.getTrack(id)->threatScore, 55);

    {
        auto session = store.openSession();
        session->persistScore(id, 99);
        QVERIFY(session->persistStatus(id, skyshield::LifecycleState::Engaged));
        // Released without commit.
    }
    QCOMPARE(store.getTrack(id)->threatScore, 55);
    QCOMPARE(QString::fromStdString(store.getTrack(id)->lifecycleState), QStringLiteral("LIVE"));
}

void TrackStoreTests::testStatusRegressionRefused()
{
    resetDb();

    skyshield::SqliteTrackStore store(dbPath());
    const int64_t id = store.upsertTrack(makeRecord("charlie", "LIVE"));

    {
        auto session = store.openSession();
        QVERIFY(session->persistStatus(id, skyshield::LifecycleState::Engaged));
        QVERIFY(session->persistStatus(id, skyshield::LifecycleState::Engaged));
        QVERIFY(!session->persistStatus(id, skyshield::LifecycleState::Live));
        QVERIFY(!session->persistStatus(id + 100, skyshield::LifecycleState::Engaged));
        session->commit();
    }

    QCOMPARE(QString::fromStdString(store.getTrack(id)->lifecycleState),
             QStringLiteral("ENGAGED"));

    auto session = store.openSession();
    QVERIFY(session->fetchLiveTracks().empty());
}

void TrackStoreTests::testUnreachableStore()
{
    resetDb();

    skyshield::SqliteTrackStore store(dbPath());
    resetDb();
    QVERIFY_EXCEPTION_THROWN(store.openSession(), skyshield::StoreConnectionError);

    const std::string blocked = m_tempDir.path().toStdString() + "/blocker";
    {
        std::ofstream file(blocked);
        file << "not a directory";
    }
    QVERIFY_EXCEPTION_THROWN(skyshield::SqliteTrackStore(blocked + "/tracks.db"),
                             skyshield::StoreConnectionError);
}

void TrackStoreTests::testBusyStoreRaisesFetchError()
{
    resetDb();

    skyshield::SqliteTrackStore store(dbPath());
    store.upsertTrack(makeRecord("delta", "LIVE"));

    // A second writer keeps the lock past the busy timeout.
    auto holder = store.openSession();
    QVERIFY_EXCEPTION_THROWN(store.openSession(), skyshield::FetchError);

    holder.reset();
    auto session = store.openSession();
    QCOMPARE(static_cast<int>(session->fetchLiveTracks().size()), 1);
}

void TrackStoreTests::testWideStoredScoreIsBounded()
{
    resetDb();

    skyshield::SqliteTrackStore store(dbPath());
    const int64_t low = store.upsertTrack(makeRecord("echo", "LIVE"));
    const int64_t high = store.upsertTrack(makeRecord("foxtrot", "LIVE"));

    sqlite3 *db = nullptr;
    QCOMPARE(sqlite3_open(dbPath().c_str(), &db), SQLITE_OK);
    const std::string sql =
        "UPDATE tracks SET threat_score = -9223372036854775808 WHERE id = "
        + std::to_string(low) + ";"
        "UPDATE tracks SET threat_score = 4294967298 WHERE id = "
        + std::to_string(high) + ";";
    QCOMPARE(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    QCOMPARE(store.getTrack(low)->threatScore, INT_MIN);
    QCOMPARE(store.getTrack(high)->threatScore, INT_MAX);
}

QTEST_MAIN(TrackStoreTests)
#include "test_track_store.moc"
