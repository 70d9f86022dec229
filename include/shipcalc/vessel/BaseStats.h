#pragma once

#include "shipcalc/vessel/CapacityTables.h"

namespace shipcalc::vessel {

// Stat tuple shared by every stage of a vessel build.
// Units: range in nm, speed in knots, fuel in the game's kg/nm scale, CO2 in
// kg per capacity unit per nm, build time in seconds.
struct VesselStats {
  double rangeNm{0.0};
  double speedKn{0.0};
  double fuel{0.0};
  double co2{0.0};
  double buildTimeSec{0.0};
};

// Baseline stats for a hull of `capacity` in class `cls`, linearly interpolated
// between the class's min- and max-capacity bounds. No clamping: capacities
// outside the class range extrapolate.
VesselStats baseStats(VesselClass cls, double capacity);

} // namespace shipcalc::vessel
