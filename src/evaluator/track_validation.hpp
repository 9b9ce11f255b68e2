#pragma once

#include "common/models.hpp"

namespace skyshield {

// Converts a raw store row into a Track. Throws DataError when the row has an
// identification outside FRIENDLY/UNKNOWN/HOSTILE, a missing or non-finite
// position, a missing, negative or non-finite speed, or an unknown lifecycle
// state. The stored score is taken as-is; the evaluator owns and rewrites it.
Track validateTrackRecord(const TrackRecord &record);

} // namespace skyshield
