#pragma once

namespace skyshield {

// Scores that moved by no more than the dead-band are recomputed but not
// written back. The comparison is strict: a change equal to the band is noise.
// A stored score outside [0, 100] is always replaced.
bool shouldPersistScore(int newScore, int storedScore, int deadBandThreshold);

} // namespace skyshield
