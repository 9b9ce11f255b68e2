#pragma once

#include "common/models.hpp"

namespace skyshield {

constexpr double kMaxRisk = 100.0;
constexpr double kNearRingRisk = 50.0;

double distanceBetween(const Position &a, const Position &b);

// Linear ramp from 0 at rest to 100 at speedCeiling, capped at 100.
double speedRisk(double speed, double speedCeiling);

// Step function: 100 inside innerRadius, 50 inside outerRadius, 0 beyond.
// Both boundaries belong to the outer band (d == innerRadius -> 50,
// d == outerRadius -> 0).
double proximityRisk(double distance, double innerRadius, double outerRadius);

double identificationRisk(Identification identification);

} // namespace skyshield
