#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "evaluator/track_store.hpp"

namespace skyshield {

// SqliteTrackStore keeps tracks in the `tracks` table shared with the
// producer. Every session opens its own connection inside an immediate
// transaction, so a cycle either lands completely or not at all.
class SqliteTrackStore : public TrackStore
{
public:
    // Creates the database file and schema when missing.
    // Throws StoreConnectionError.
    explicit SqliteTrackStore(std::string databasePath);
    ~SqliteTrackStore() override;

    std::unique_ptr<TrackStoreSession> openSession() override;

    const std::string &databasePath() const
    {
        return m_databasePath;
    }

    bool integrityCheck(std::string *message) const;

    // Producer-side helpers. A record with id 0 gets an id assigned by SQLite.
    int64_t upsertTrack(const TrackRecord &record);
    std::optional<TrackRecord> getTrack(int64_t id) const;
    std::vector<TrackRecord> listTracks() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
    std::string m_databasePath;
};

} // namespace skyshield
