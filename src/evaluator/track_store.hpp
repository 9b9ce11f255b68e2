#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "common/models.hpp"

namespace skyshield {

// One cycle's view of the track store. A session owns its connection and
// releases it on destruction; writes that were not committed are rolled back.
class TrackStoreSession
{
public:
    virtual ~TrackStoreSession() = default;

    // Snapshot of every track whose lifecycle state is LIVE.
    // Throws FetchError.
    virtual std::vector<TrackRecord> fetchLiveTracks() = 0;

    // Idempotent. Throws PersistError.
    virtual void persistScore(int64_t trackId, int score) = 0;

    // Idempotent. Returns false when nothing was written, which includes a
    // refused ENGAGED -> LIVE regression. Throws PersistError.
    virtual bool persistStatus(int64_t trackId, LifecycleState status) = 0;

    // Throws PersistError.
    virtual void commit() = 0;
};

// Gateway between the evaluator and whatever holds the tracks.
class TrackStore
{
public:
    virtual ~TrackStore() = default;

    // Throws StoreConnectionError when the store cannot be reached, and
    // FetchError when it is reachable but locked by another writer.
    virtual std::unique_ptr<TrackStoreSession> openSession() = 0;
};

} // namespace skyshield
