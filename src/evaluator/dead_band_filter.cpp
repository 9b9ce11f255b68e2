#include "evaluator/dead_band_filter.hpp"

#include <cstdlib>

#include "evaluator/risk_factors.hpp"

namespace skyshield {

bool shouldPersistScore(int newScore, int storedScore, int deadBandThreshold)
{
    if (storedScore < 0 || storedScore > static_cast<int>(kMaxRisk)) {
        return true;
    }
    return std::llabs(static_cast<long long>(newScore) - storedScore) > deadBandThreshold;
}

} // namespace skyshield
