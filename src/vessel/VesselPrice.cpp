#include "shipcalc/vessel/VesselPrice.h"

#include "shipcalc/core/Assert.h"

namespace shipcalc::vessel {

double basePrice(VesselClass cls, double capacity) {
  const CapacityRange& r = capacityRange(cls);
  return interpolate(capacity, r.min, r.max, r.minPrice, r.maxPrice);
}

double enginePrice(const EngineModel& engine, double engineKw) {
  SHIPCALC_ASSERT_MSG(engineKwInBand(engine, engineKw), "enginePrice: engineKw outside the engine's [minKw, maxKw] band");
  const double extraKw = engineKw - engine.minKw;
  return engine.basePrice + extraKw * engine.pricePerExtraKw;
}

PriceBreakdown priceVessel(VesselClass cls,
                           double capacity,
                           const EngineModel* engine,
                           double engineKw,
                           const PerkSelection* perks) {
  PriceBreakdown out{};
  out.basePrice = basePrice(cls, capacity);
  if (engine) out.enginePrice = enginePrice(*engine, engineKw);
  out.vesselPrice = out.basePrice + out.enginePrice;
  out.total = out.vesselPrice;

  if (!perks) return out;

  out.perkFactor = perkPriceFactor(*perks);
  out.perkCost = out.vesselPrice * out.perkFactor;
  out.total = out.vesselPrice + out.perkCost;

  if (perks->enhancedThrusters) {
    out.thrustersSurcharge = capacity * kEnhancedThrusters.pricePerCapacityUnit;
    out.total += out.thrustersSurcharge;
  }
  return out;
}

} // namespace shipcalc::vessel
