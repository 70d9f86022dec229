#include "shipcalc/vessel/BaseStats.h"

namespace shipcalc::vessel {

VesselStats baseStats(VesselClass cls, double capacity) {
  const CapacityRange& r = capacityRange(cls);
  const StatBounds& s = r.stats;

  VesselStats out{};
  out.rangeNm      = interpolate(capacity, r.min, r.max, s.minRangeNm, s.maxRangeNm);
  out.speedKn      = interpolate(capacity, r.min, r.max, s.minSpeedKn, s.maxSpeedKn);
  out.fuel         = interpolate(capacity, r.min, r.max, s.minFuel, s.maxFuel);
  out.co2          = interpolate(capacity, r.min, r.max, s.minCo2, s.maxCo2);
  out.buildTimeSec = interpolate(capacity, r.min, r.max, r.minBuildTimeSec, r.maxBuildTimeSec);
  return out;
}

} // namespace shipcalc::vessel
