#include "evaluator/track_validation.hpp"

#include <cmath>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace skyshield {

namespace {

std::string describe(const TrackRecord &record)
{
    return "track " + std::to_string(record.id)
        + (record.externalRef.empty() ? std::string() : " (" + record.externalRef + ")");
}

} // namespace

Track validateTrackRecord(const TrackRecord &record)
{
    const auto identification = parseIdentificationString(record.identification);
    if (!identification.has_value()) {
        throw DataError(record.id, describe(record) + ": unknown identification '"
                                       + record.identification + "'");
    }

    if (!record.x.has_value() || !record.y.has_value()
        || !std::isfinite(*record.x) || !std::isfinite(*record.y)) {
        throw DataError(record.id, describe(record) + ": malformed position");
    }

    if (!record.speed.has_value() || !std::isfinite(*record.speed) || *record.speed < 0.0) {
        throw DataError(record.id, describe(record) + ": malformed speed");
    }

    const auto state = parseLifecycleString(record.lifecycleState);
    if (!state.has_value()) {
        throw DataError(record.id, describe(record) + ": unknown lifecycle state '"
                                       + record.lifecycleState + "'");
    }

    Track track;
    track.id = record.id;
    track.externalRef = record.externalRef;
    track.position = Position{*record.x, *record.y};
    track.speed = *record.speed;
    track.identification = *identification;
    track.threatScore = record.threatScore;
    track.lifecycleState = *state;
    return track;
}

} // namespace skyshield
