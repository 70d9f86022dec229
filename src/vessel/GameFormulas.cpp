#include "shipcalc/vessel/GameFormulas.h"

#include <algorithm>
#include <cmath>

namespace shipcalc::vessel {

double gameTeuEquivalent(VesselClass cls, double capacity) {
  if (cls == VesselClass::Tanker) return std::round(capacity / kBarrelsPerTeu);
  return capacity;
}

double gameBaseSpeed(double engineKw, double teu) {
  if (teu <= 0.0) return 0.0;
  const double raw = std::ceil(5.7 * (engineKw / teu) + teu / 1000.0);
  return std::max(kGameMinSpeedKn, std::min(kGameMaxSpeedKn, raw));
}

double gameRange(double engineKw, double teu) {
  if (teu <= 0.0) return 0.0;
  return std::min(kGameMaxRangeNm, std::ceil(8000.0 * engineKw / teu));
}

double gameFuelPerNm(double teu, double speedKn) {
  if (teu <= 0.0 || speedKn <= 0.0) return 0.0;
  return std::ceil(teu * std::sqrt(speedKn) * kGameFuelFactor / 40.0);
}

double gamePropellerSpeed(double baseSpeedKn, Propeller propeller) {
  // 25 * 1.12 is 28.000000000000004 in binary floating point and rounds up to 29;
  // the game does the same, so no epsilon is applied.
  const double boosted = std::ceil(baseSpeedKn * (1.0 + propellerDef(propeller).speedDelta));
  return std::min(kGameMaxSpeedKn, boosted);
}

} // namespace shipcalc::vessel
