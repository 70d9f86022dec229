#pragma once

#include "shipcalc/core/Types.h"

#include <string_view>

namespace shipcalc::vessel {

// -----------------------------------------------------------------------------
// Vessel classes and their capacity ranges
// -----------------------------------------------------------------------------
//
// A capacity value only has meaning relative to its class: containers are sized
// in TEU, tankers in barrels. Every formula that mixes the two goes through an
// explicit conversion (see Engine.h toContainerCapacity and
// econ::effectiveCapacity), never inline arithmetic.

enum class VesselClass : core::u8 {
  Container = 0,
  Tanker    = 1,
};

inline constexpr std::size_t kVesselClassCount = 2;

struct StatBounds {
  double minRangeNm;
  double maxRangeNm;
  double minSpeedKn;
  double maxSpeedKn;
  double minFuel;
  double maxFuel;
  double minCo2;
  double maxCo2;
};

struct CapacityRange {
  VesselClass cls;
  const char* id;     // wire name ("container" / "tanker")
  const char* unit;   // "TEU" / "BBL"
  double min;
  double max;
  StatBounds stats;   // stat values at min and max capacity
  double minPrice;
  double maxPrice;
  double minBuildTimeSec;
  double maxBuildTimeSec;
  double sliderStep;  // capacity granularity offered by the build wizard
};

// Aborts on a VesselClass value outside the enum (caller defect).
const CapacityRange& capacityRange(VesselClass cls);

std::string_view vesselClassId(VesselClass cls);

// Accepts "container"/"tanker" (case-insensitive). Returns false for anything else.
bool tryParseVesselClass(std::string_view text, VesselClass& out);

bool isKnownVesselClass(VesselClass cls);

// True if capacity lies within [min, max] for the class.
bool capacityInRange(VesselClass cls, double capacity);

// Linear interpolation of `value` between (minVal -> minResult) and (maxVal -> maxResult).
// Values outside [minVal, maxVal] extrapolate. A zero-width domain returns minResult.
// Both endpoints are reproduced exactly.
double interpolate(double value, double minVal, double maxVal, double minResult, double maxResult);

} // namespace shipcalc::vessel
