#include "evaluator/risk_factors.hpp"

#include <algorithm>
#include <cmath>

namespace skyshield {

double distanceBetween(const Position &a, const Position &b)
{
    return std::hypot(a.x - b.x, a.y - b.y);
}

double speedRisk(double speed, double speedCeiling)
{
    return std::min(kMaxRisk, (speed / speedCeiling) * kMaxRisk);
}

double proximityRisk(double distance, double innerRadius, double outerRadius)
{
    if (distance < innerRadius) {
        return kMaxRisk;
    }
    if (distance < outerRadius) {
        return kNearRingRisk;
    }
    return 0.0;
}

double identificationRisk(Identification identification)
{
    switch (identification) {
    case Identification::Friendly:
        return 0.0;
    case Identification::Unknown:
        return 40.0;
    case Identification::Hostile:
        return kMaxRisk;
    }
    return 0.0;
}

} // namespace skyshield
