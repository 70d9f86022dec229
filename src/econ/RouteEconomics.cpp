#include "shipcalc/econ/RouteEconomics.h"

#include "shipcalc/core/Log.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace shipcalc::econ {

double effectiveCapacity(double capacity, vessel::VesselClass cls) {
  if (cls == vessel::VesselClass::Tanker) return capacity / kTankerBarrelsPerTeu;
  return capacity;
}

double routeCreationFee(double capacity, double distanceNm, vessel::VesselClass cls) {
  return std::round(40.0 * effectiveCapacity(capacity, cls) + 10.0 * distanceNm);
}

double travelTimeSeconds(double distanceNm, double speedKn) {
  const double baseTime = 600.0 + 6.0 * std::min(kNearRegimeNm, distanceNm);
  if (distanceNm <= kNearRegimeNm) return baseTime;
  if (speedKn <= 0.0) return 0.0;
  return std::floor(baseTime + ((distanceNm - kNearRegimeNm) / speedKn) * 75.0);
}

HarborFeeRange harborFeeRange(double distanceNm) {
  if (!(distanceNm > 0.0)) return {};
  const double base = 17000.0 / distanceNm;
  static const double kMaxMultiplier = std::pow(27000.0, 0.2); // ~7.697
  return {base, base * kMaxMultiplier};
}

double routeFuelTonnes(double capacity, double distanceNm, double speedKn, double fuelFactor,
                       vessel::VesselClass cls) {
  if (speedKn <= 0.0) return 0.0;
  return (effectiveCapacity(capacity, cls) / 2000.0) * distanceNm * std::sqrt(speedKn) / 20.0 * fuelFactor;
}

double guardsCost(int guards) {
  return (double)guards * kGuardCost;
}

RouteQuote quoteRoute(const RouteParameters& p) {
  RouteQuote q{};
  q.effectiveCapacity = effectiveCapacity(p.capacity, p.cls);
  q.creationFee = routeCreationFee(p.capacity, p.distanceNm, p.cls);
  q.travelTimeSec = travelTimeSeconds(p.distanceNm, p.speedKn);
  q.harborFee = harborFeeRange(p.distanceNm);
  q.fuelTonnes = routeFuelTonnes(p.capacity, p.distanceNm, p.speedKn, p.fuelFactor, p.cls);
  q.guardsCost = guardsCost(p.guards);

  if (core::getLogLevel() <= core::LogLevel::Debug) {
    std::ostringstream oss;
    oss << "quoteRoute: dist=" << p.distanceNm << "nm speed=" << p.speedKn
        << "kn cap=" << q.effectiveCapacity << " fee=" << q.creationFee
        << " time=" << q.travelTimeSec << "s fuel=" << q.fuelTonnes << "t";
    SHIPCALC_LOG_DEBUG(oss.str());
  }
  return q;
}

std::optional<ReferenceFuelRate> referenceFuelRate(double capacity, vessel::VesselClass cls,
                                                   double refSpeedKn, double fuelFactor) {
  const double cap = effectiveCapacity(capacity, cls);
  if (cap <= 0.0 || refSpeedKn <= 0.0) return std::nullopt;
  if (fuelFactor <= 0.0) fuelFactor = 1.0;

  ReferenceFuelRate r{};
  r.kgPerNm = std::round(cap * std::sqrt(refSpeedKn) * fuelFactor / 40.0 * 100.0) / 100.0;
  r.refSpeedKn = refSpeedKn;
  return r;
}

double tripFuelTonnes(const ReferenceFuelRate& rate, double distanceNm, double actualSpeedKn) {
  if (rate.refSpeedKn <= 0.0) return 0.0;
  const double fuelKg = distanceNm * (actualSpeedKn / rate.refSpeedKn) * rate.kgPerNm;
  return fuelKg / 1000.0;
}

void writeRoutePayload(core::JsonWriter& w, std::string_view routeId, const RouteParameters& p,
                       const RouteQuote& q) {
  w.beginObject();
  w.key("route_id"); w.value(routeId);
  w.key("speed"); w.value(p.speedKn);
  w.key("guards"); w.value(p.guards);
  w.key("distance"); w.value(p.distanceNm);
  w.key("creation_fee"); w.value(q.creationFee);
  w.key("travel_time"); w.value(q.travelTimeSec);
  w.key("fuel_tonnes"); w.value(q.fuelTonnes);
  w.key("guards_cost"); w.value(q.guardsCost);
  w.key("harbor_fee");
  w.beginObject();
  w.key("min"); w.value(q.harborFee.min);
  w.key("max"); w.value(q.harborFee.max);
  w.endObject();
  w.endObject();
}

} // namespace shipcalc::econ
