#pragma once

#include "shipcalc/core/JsonWriter.h"
#include "shipcalc/vessel/CapacityTables.h"

#include <optional>
#include <string_view>

namespace shipcalc::econ {

// -----------------------------------------------------------------------------
// Route economics
// -----------------------------------------------------------------------------
//
// Independent pure formulas for pricing and timing a route. Fee and fuel
// constants were authored in container (TEU) units; tanker capacities are
// brought into that scale with effectiveCapacity().
//
// Units: distance in nm, speed in knots, money in $, time in seconds, fuel in tonnes.

inline constexpr double kTankerBarrelsPerTeu = 74.0;
inline constexpr double kGuardCost = 700.0;
inline constexpr double kNearRegimeNm = 200.0;

// Tankers: capacity / 74. Containers: capacity unchanged.
double effectiveCapacity(double capacity, vessel::VesselClass cls);

// round(40 * effectiveCapacity + 10 * distance)
double routeCreationFee(double capacity, double distanceNm, vessel::VesselClass cls);

// base = 600 + 6 * min(200, distance)
//   distance <= 200: base
//   otherwise:       floor(base + (distance - 200) / speed * 75)
// A non-positive speed beyond 200 nm yields 0.
double travelTimeSeconds(double distanceNm, double speedKn);

struct HarborFeeRange {
  double min{0.0};
  double max{0.0};
};

// Harbor fee per capacity unit: min = 17000 / distance, max = min * 27000^0.2.
// distance <= 0 yields {0, 0}.
HarborFeeRange harborFeeRange(double distanceNm);

// (effectiveCapacity / 2000) * distance * sqrt(speed) / 20 * fuelFactor, in tonnes.
// A non-positive speed yields 0.
double routeFuelTonnes(double capacity, double distanceNm, double speedKn, double fuelFactor,
                       vessel::VesselClass cls);

// guards * 700, no volume discount.
double guardsCost(int guards);

// Candidate route plus the resolved vessel that would sail it.
struct RouteParameters {
  double distanceNm{0.0};
  double speedKn{0.0};
  double capacity{0.0};
  vessel::VesselClass cls{vessel::VesselClass::Container};
  double fuelFactor{1.0};
  int guards{0};
};

struct RouteQuote {
  double effectiveCapacity{0.0};
  double creationFee{0.0};
  double travelTimeSec{0.0};
  HarborFeeRange harborFee{};
  double fuelTonnes{0.0};
  double guardsCost{0.0};
};

// All route formulas for one candidate route.
RouteQuote quoteRoute(const RouteParameters& p);

// ---- Reference-speed fuel model ----
//
// Vessels report a fuel rate at their reference (max) speed; trip fuel scales
// that rate linearly with the actual speed.

struct ReferenceFuelRate {
  double kgPerNm{0.0};  // rounded to 2 decimals
  double refSpeedKn{0.0};
};

// kgPerNm = effectiveCapacity * sqrt(refSpeed) * fuelFactor / 40.
// Returns nullopt when capacity or speed is not positive. A non-positive
// fuelFactor means "unknown" and is treated as 1.
std::optional<ReferenceFuelRate> referenceFuelRate(double capacity, vessel::VesselClass cls,
                                                   double refSpeedKn, double fuelFactor);

// distance * (actualSpeed / refSpeed) * kgPerNm / 1000
double tripFuelTonnes(const ReferenceFuelRate& rate, double distanceNm, double actualSpeedKn);

// Writes the figures the route-creation endpoint consumes next to the caller's route id.
void writeRoutePayload(core::JsonWriter& w, std::string_view routeId, const RouteParameters& p,
                       const RouteQuote& q);

} // namespace shipcalc::econ
