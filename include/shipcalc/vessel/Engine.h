#pragma once

#include "shipcalc/vessel/CapacityTables.h"

#include <cstddef>
#include <string_view>

namespace shipcalc::vessel {

// -----------------------------------------------------------------------------
// Engine models
// -----------------------------------------------------------------------------
//
// Each model covers a kW band and carries four authored (range, speed) corner
// samples at the extremes of its (capacity, power) domain. Corner samples are
// expressed in the *container* capacity domain regardless of the vessel class
// being built; tanker capacities are re-mapped with toContainerCapacity() first.
//
// The corners were authored from the game's closed-form speed/range formulas
// (GameFormulas.h) evaluated at 2000/27000 TEU and the band edges.

struct EngineCorner {
  double rangeNm;
  double speedKn;
};

struct EngineModel {
  const char* id;
  const char* name;
  double minKw;
  double maxKw;
  double pricePerExtraKw;
  double basePrice;
  int sortOrder;
  bool isDefault;

  EngineCorner minCapMinKw;
  EngineCorner minCapMaxKw;
  EngineCorner maxCapMinKw;
  EngineCorner maxCapMaxKw;
};

inline constexpr EngineModel kEngineModels[] = {
  // id, name, minKw, maxKw, $/kW, base price, sort, default,
  //   {range, speed} at (2000 TEU, minKw), (2000 TEU, maxKw), (27000 TEU, minKw), (27000 TEU, maxKw)
  {"mih_x1",         "MIH X1",         2500.0, 11000.0, 833.0,  2082500.0, 1, true,
   {10000.0, 10.0}, {18000.0, 34.0}, {741.0, 28.0},  {3260.0, 30.0}},
  {"wartsila_syk_6", "Wartsila SYK-6", 5000.0, 15000.0, 833.0,  4165000.0, 2, false,
   {18000.0, 17.0}, {18000.0, 35.0}, {1482.0, 29.0}, {4445.0, 31.0}},
  {"man_p22l",       "MAN P22L",       8000.0, 17500.0, 833.0,  6664000.0, 3, false,
   {18000.0, 25.0}, {18000.0, 35.0}, {2371.0, 29.0}, {5186.0, 31.0}},
  {"mih_xp9",        "MIH XP9",       10000.0, 20000.0, 833.0,  8330000.0, 4, false,
   {18000.0, 31.0}, {18000.0, 35.0}, {2963.0, 30.0}, {5926.0, 32.0}},
  {"man_p22l_z",     "MAN P22L-Z",    15000.0, 25000.0, 833.0, 12495000.0, 5, false,
   {18000.0, 35.0}, {18000.0, 35.0}, {4445.0, 31.0}, {7408.0, 33.0}},
  {"mih_cp9",        "MIH CP9",       25000.0, 60000.0, 833.0, 20825000.0, 6, false,
   {18000.0, 35.0}, {18000.0, 35.0}, {7408.0, 33.0}, {17778.0, 35.0}},
};

inline constexpr std::size_t engineModelCount() {
  return sizeof(kEngineModels) / sizeof(kEngineModels[0]);
}

// Lookup by wire id. Returns nullptr for unknown ids (use for untrusted input).
const EngineModel* findEngine(std::string_view id);

// Lookup by wire id. Aborts on an unknown id (caller defect).
const EngineModel& engineModel(std::string_view id);

// The model pre-selected by the build wizard (MIH X1).
const EngineModel& defaultEngine();

bool engineKwInBand(const EngineModel& engine, double engineKw);

// Clamp into [minKw, maxKw]. Callers are expected to do this before interpolating.
double clampEngineKw(const EngineModel& engine, double engineKw);

// Re-map a capacity from its native class domain into the container domain:
//   fraction = (capacity - nativeMin) / (nativeMax - nativeMin)
//   result   = containerMin + fraction * (containerMax - containerMin)
// Container capacities map onto themselves.
double toContainerCapacity(VesselClass cls, double capacity);

struct EnginePerformance {
  double rangeNm{0.0};
  double speedKn{0.0};
};

// Bilinear interpolation of (range, speed) for an engine running at `engineKw`
// on a hull of `capacity` (native units of `cls`).
//
// The kW axis is interpolated first at both capacity corners, then the two
// results are blended along the capacity axis. The corner samples are not
// symmetric, so the order is part of the contract.
//
// Aborts if engineKw lies outside [minKw, maxKw] (unclamped caller input).
EnginePerformance interpolateEngine(VesselClass cls, double capacity, const EngineModel& engine, double engineKw);

} // namespace shipcalc::vessel
