#include "shipcalc/vessel/CapacityTables.h"

#include "shipcalc/core/Assert.h"

#include <array>
#include <cctype>
#include <cmath>
#include <string>

namespace shipcalc::vessel {

static const std::array<CapacityRange, kVesselClassCount> kRanges = {{
  // cls, id, unit, min, max,
  //   {range, speed, fuel, co2 at min/max},
  //   price min/max, build time min/max (s), slider step
  {VesselClass::Container, "container", "TEU", 2000.0, 27000.0,
   {10000.0, 742.0, 10.0, 28.0, 158.0, 3562.0, 1.87, 0.20},
   17800000.0, 240300000.0, 24000.0, 172800.0, 100.0},
  {VesselClass::Tanker, "tanker", "BBL", 148000.0, 1998000.0,
   {10000.0, 742.0, 10.0, 28.0, 157.0, 3537.0, 1.90, 0.67},
   17800000.0, 240300000.0, 24000.0, 172800.0, 1000.0},
}};

bool isKnownVesselClass(VesselClass cls) {
  return static_cast<std::size_t>(cls) < kRanges.size();
}

const CapacityRange& capacityRange(VesselClass cls) {
  SHIPCALC_ASSERT_MSG(isKnownVesselClass(cls), "capacityRange: unknown VesselClass");
  return kRanges[static_cast<std::size_t>(cls)];
}

std::string_view vesselClassId(VesselClass cls) {
  return capacityRange(cls).id;
}

bool tryParseVesselClass(std::string_view text, VesselClass& out) {
  std::string tok;
  tok.reserve(text.size());
  for (const unsigned char c : text) {
    if (std::isspace(c)) continue;
    tok.push_back((char)std::tolower(c));
  }

  for (const auto& r : kRanges) {
    if (tok == r.id) {
      out = r.cls;
      return true;
    }
  }
  return false;
}

bool capacityInRange(VesselClass cls, double capacity) {
  const CapacityRange& r = capacityRange(cls);
  return capacity >= r.min && capacity <= r.max;
}

double interpolate(double value, double minVal, double maxVal, double minResult, double maxResult) {
  if (maxVal == minVal) return minResult;
  const double ratio = (value - minVal) / (maxVal - minVal);
  // std::lerp is minResult + ratio * (maxResult - minResult) with exact endpoints.
  return std::lerp(minResult, maxResult, ratio);
}

} // namespace shipcalc::vessel
