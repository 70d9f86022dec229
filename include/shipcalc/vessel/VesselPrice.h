#pragma once

#include "shipcalc/vessel/CapacityTables.h"
#include "shipcalc/vessel/Engine.h"
#include "shipcalc/vessel/Perks.h"

namespace shipcalc::vessel {

// Hull price interpolated between the class's price bounds by capacity.
double basePrice(VesselClass cls, double capacity);

// engine.basePrice + (engineKw - engine.minKw) * engine.pricePerExtraKw
// engineKw must lie in [minKw, maxKw]; clamp user input with clampEngineKw first.
double enginePrice(const EngineModel& engine, double engineKw);

struct PriceBreakdown {
  double basePrice{0.0};
  double enginePrice{0.0};
  double vesselPrice{0.0};        // basePrice + enginePrice
  double perkFactor{0.0};
  double perkCost{0.0};           // vesselPrice * perkFactor
  double thrustersSurcharge{0.0}; // capacity * pricePerCapacityUnit
  double total{0.0};
};

// Staged vessel price. Stages that have not been reached are passed as nullptr:
//  - engine == nullptr: hull only (total == basePrice)
//  - perks  == nullptr: hull + engine, no perk pricing
// With perks, total = vesselPrice * (1 + perkFactor) + enhanced-thrusters surcharge.
// The surcharge is flat and is not scaled by perkFactor.
PriceBreakdown priceVessel(VesselClass cls,
                           double capacity,
                           const EngineModel* engine,
                           double engineKw,
                           const PerkSelection* perks);

} // namespace shipcalc::vessel
