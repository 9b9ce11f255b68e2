#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace skyshield {

// Fatal: the configuration cannot be loaded or violates an invariant.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fatal: the track store cannot be opened or reached at all.
class StoreConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Recoverable: the current cycle's read failed; the cycle is skipped.
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Recoverable: a single track record is malformed and is skipped.
class DataError : public std::runtime_error {
public:
    DataError(int64_t trackId, const std::string &message)
        : std::runtime_error(message)
        , m_trackId(trackId)
    {
    }

    int64_t trackId() const
    {
        return m_trackId;
    }

private:
    int64_t m_trackId;
};

// Recoverable: a score/status write or the cycle commit failed.
class PersistError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace skyshield
