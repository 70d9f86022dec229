#pragma once

#include "shipcalc/vessel/CapacityTables.h"
#include "shipcalc/vessel/Perks.h"

namespace shipcalc::vessel {

// Closed-form formulas the game itself uses for built vessels. The engine corner
// tables in Engine.h were authored from these; they are also useful on their own
// as a cross-check of interpolated values.
//
// `teu` is a container-equivalent capacity: containers as-is, tankers through
// gameTeuEquivalent(). Non-positive capacities yield 0.

inline constexpr double kGameMinSpeedKn = 5.0;
inline constexpr double kGameMaxSpeedKn = 35.0;
inline constexpr double kGameMaxRangeNm = 18000.0;
inline constexpr double kGameFuelFactor = 0.994;
inline constexpr double kBarrelsPerTeu = 74.0;

// Tankers: round(barrels / 74). Containers: capacity unchanged.
double gameTeuEquivalent(VesselClass cls, double capacity);

// max(5, min(35, ceil(5.7 * kW / teu + teu / 1000)))
double gameBaseSpeed(double engineKw, double teu);

// min(18000, ceil(8000 * kW / teu))
double gameRange(double engineKw, double teu);

// ceil(teu * sqrt(speed) * 0.994 / 40)
double gameFuelPerNm(double teu, double speedKn);

// min(35, ceil(baseSpeed * (1 + propeller.speedDelta)))
double gamePropellerSpeed(double baseSpeedKn, Propeller propeller);

} // namespace shipcalc::vessel
