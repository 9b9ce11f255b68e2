#include "evaluator/sqlite_track_store.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <utility>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace skyshield {

namespace {

constexpr int kBusyTimeoutMs = 2000;

constexpr const char *kCreateTracksTable =
    "CREATE TABLE IF NOT EXISTS tracks ("
    "    id INTEGER PRIMARY KEY,"
    "    track_uuid TEXT NOT NULL,"
    "    x_pos REAL,"
    "    y_pos REAL,"
    "    speed_knots REAL,"
    "    iff_status TEXT NOT NULL DEFAULT 'UNKNOWN',"
    "    threat_score INTEGER NOT NULL DEFAULT 0,"
    "    status TEXT NOT NULL DEFAULT 'LIVE'"
    ");";

constexpr const char *kCreateStatusIndex =
    "CREATE INDEX IF NOT EXISTS idx_tracks_status ON tracks(status);";

constexpr const char *kSelectColumns =
    "SELECT id, track_uuid, x_pos, y_pos, speed_knots, iff_status, "
    "threat_score, status FROM tracks";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

// Owns one sqlite3 handle; closes it on every exit path.
class Connection {
public:
    Connection(const std::string &path, int flags)
    {
        const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
        if (rc != SQLITE_OK) {
            const std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            sqlite3_close(db);
            db = nullptr;
            throw StoreConnectionError("cannot open track store " + path + ": " + message);
        }
        sqlite3_busy_timeout(db, kBusyTimeoutMs);
    }

    ~Connection()
    {
        if (db) {
            sqlite3_close(db);
        }
    }

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    sqlite3 *get() const
    {
        return db;
    }

private:
    sqlite3 *db = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalDouble(sqlite3_stmt *stmt, int index, const std::optional<double> &value)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_double(stmt, index, *value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

// Only numeric storage classes count as a value; NULL and text are reported
// as missing so validation can reject the row.
std::optional<double> columnNumber(sqlite3_stmt *stmt, int index)
{
    const int type = sqlite3_column_type(stmt, index);
    if (type != SQLITE_INTEGER && type != SQLITE_FLOAT) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, index);
}

TrackRecord readRecord(sqlite3_stmt *stmt)
{
    TrackRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.externalRef = columnText(stmt, 1);
    record.x = columnNumber(stmt, 2);
    record.y = columnNumber(stmt, 3);
    record.speed = columnNumber(stmt, 4);
    record.identification = columnText(stmt, 5);
    // Out-of-range scores are kept visible to the dead-band filter, which
    // rewrites them; only the int conversion is bounded here.
    const sqlite3_int64 storedScore = sqlite3_column_int64(stmt, 6);
    record.threatScore = static_cast<int>(std::clamp<sqlite3_int64>(
        storedScore, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
    record.lifecycleState = columnText(stmt, 7);
    return record;
}

class SqliteTrackStoreSession : public TrackStoreSession
{
public:
    explicit SqliteTrackStoreSession(const std::string &path)
        : m_connection(path, SQLITE_OPEN_READWRITE)
    {
        char *error = nullptr;
        const int rc = sqlite3_exec(m_connection.get(), "BEGIN IMMEDIATE;", nullptr, nullptr,
                                    &error);
        if (rc == SQLITE_OK) {
            return;
        }
        const std::string message = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);

        // A producer holding the write lock past the busy timeout only costs
        // this cycle.
        const int primary = rc & 0xff;
        if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
            throw FetchError("track store busy, cycle skipped: " + message);
        }
        throw StoreConnectionError("cannot begin cycle transaction: " + message);
    }

    ~SqliteTrackStoreSession() override
    {
        if (m_committed) {
            return;
        }
        char *error = nullptr;
        if (sqlite3_exec(m_connection.get(), "ROLLBACK;", nullptr, nullptr, &error)
            != SQLITE_OK) {
            const std::string message = error ? error : "rollback failed";
            sqlite3_free(error);
            SLOG_WARN(QStringLiteral("SqliteTrackStore"),
                      QStringLiteral("~SqliteTrackStoreSession"),
                      QStringLiteral("rollback_failed"),
                      QStringLiteral("session_released_uncommitted"),
                      QStringLiteral("sqlite_rollback"),
                      skyshield::logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"error", message}});
        }
    }

    std::vector<TrackRecord> fetchLiveTracks() override
    {
        try {
            const std::string sql =
                std::string(kSelectColumns) + " WHERE status = 'LIVE' ORDER BY id ASC;";
            Statement stmt(m_connection.get(), sql.c_str());

            std::vector<TrackRecord> records;
            int rc = SQLITE_ROW;
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
                records.push_back(readRecord(stmt.get()));
            }
            if (rc != SQLITE_DONE) {
                throw std::runtime_error(sqlite3_errmsg(m_connection.get()));
            }
            return records;
        } catch (const std::runtime_error &ex) {
            throw FetchError(std::string("failed to fetch live tracks: ") + ex.what());
        }
    }

    void persistScore(int64_t trackId, int score) override
    {
        try {
            Statement stmt(m_connection.get(),
                           "UPDATE tracks SET threat_score = ? WHERE id = ?;");
            sqlite3_bind_int(stmt.get(), 1, score);
            sqlite3_bind_int64(stmt.get(), 2, trackId);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw std::runtime_error(sqlite3_errmsg(m_connection.get()));
            }
        } catch (const std::runtime_error &ex) {
            throw PersistError("failed to persist score for track "
                               + std::to_string(trackId) + ": " + ex.what());
        }
    }

    bool persistStatus(int64_t trackId, LifecycleState status) override
    {
        try {
            Statement stmt(m_connection.get(),
                           "UPDATE tracks SET status = ?1 WHERE id = ?2 "
                           "AND NOT (status = 'ENGAGED' AND ?1 = 'LIVE');");
            bindText(stmt.get(), 1, toLifecycleString(status));
            sqlite3_bind_int64(stmt.get(), 2, trackId);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw std::runtime_error(sqlite3_errmsg(m_connection.get()));
            }
            return sqlite3_changes(m_connection.get()) > 0;
        } catch (const std::runtime_error &ex) {
            throw PersistError("failed to persist status for track "
                               + std::to_string(trackId) + ": " + ex.what());
        }
    }

    void commit() override
    {
        try {
            execOrThrow(m_connection.get(), "COMMIT;");
        } catch (const std::runtime_error &ex) {
            throw PersistError(std::string("failed to commit cycle: ") + ex.what());
        }
        m_committed = true;
    }

private:
    Connection m_connection;
    bool m_committed = false;
};

} // namespace

struct SqliteTrackStore::Impl {
    std::unique_ptr<Connection> admin;
};

SqliteTrackStore::SqliteTrackStore(std::string databasePath)
    : impl(std::make_unique<Impl>())
    , m_databasePath(std::move(databasePath))
{
    const std::filesystem::path dbPath(m_databasePath);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
        if (error) {
            throw StoreConnectionError("cannot create directory for track store "
                                       + m_databasePath + ": " + error.message());
        }
    }

    impl->admin = std::make_unique<Connection>(
        m_databasePath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    try {
        execOrThrow(impl->admin->get(), kCreateTracksTable);
        execOrThrow(impl->admin->get(), kCreateStatusIndex);
    } catch (const std::runtime_error &ex) {
        throw StoreConnectionError(std::string("cannot initialise track schema: ")
                                   + ex.what());
    }
}

SqliteTrackStore::~SqliteTrackStore() = default;

std::unique_ptr<TrackStoreSession> SqliteTrackStore::openSession()
{
    return std::make_unique<SqliteTrackStoreSession>(m_databasePath);
}

bool SqliteTrackStore::integrityCheck(std::string *message) const
{
    try {
        Statement stmt(impl->admin->get(), "PRAGMA integrity_check;");

        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            if (message) {
                *message = "integrity_check failed to return a result";
            }
            return false;
        }

        const std::string result = columnText(stmt.get(), 0);
        if (message) {
            *message = result;
        }
        return result == "ok";
    } catch (const std::runtime_error &ex) {
        if (message) {
            *message = ex.what();
        }
        return false;
    }
}

int64_t SqliteTrackStore::upsertTrack(const TrackRecord &record)
{
    Statement stmt(impl->admin->get(),
                   "INSERT OR REPLACE INTO tracks (id, track_uuid, x_pos, y_pos, "
                   "speed_knots, iff_status, threat_score, status) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    if (record.id == 0) {
        sqlite3_bind_null(stmt.get(), 1);
    } else {
        sqlite3_bind_int64(stmt.get(), 1, record.id);
    }
    bindText(stmt.get(), 2, record.externalRef);
    bindOptionalDouble(stmt.get(), 3, record.x);
    bindOptionalDouble(stmt.get(), 4, record.y);
    bindOptionalDouble(stmt.get(), 5, record.speed);
    bindText(stmt.get(), 6, record.identification);
    sqlite3_bind_int(stmt.get(), 7, record.threatScore);
    bindText(stmt.get(), 8, record.lifecycleState.empty() ? "LIVE" : record.lifecycleState);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("failed to upsert track");
    }
    return sqlite3_last_insert_rowid(impl->admin->get());
}

std::optional<TrackRecord> SqliteTrackStore::getTrack(int64_t id) const
{
    const std::string sql = std::string(kSelectColumns) + " WHERE id = ? LIMIT 1;";
    Statement stmt(impl->admin->get(), sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readRecord(stmt.get());
}

std::vector<TrackRecord> SqliteTrackStore::listTracks() const
{
    const std::string sql = std::string(kSelectColumns) + " ORDER BY id ASC;";
    Statement stmt(impl->admin->get(), sql.c_str());

    std::vector<TrackRecord> records;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        records.push_back(readRecord(stmt.get()));
    }
    return records;
}

} // namespace skyshield
