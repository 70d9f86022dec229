#include "shipcalc/vessel/BaseStats.h"

#include "test_harness.h"

using namespace shipcalc;

int test_base_stats() {
  int failures = 0;

  using vessel::VesselClass;

  // ---- Table sanity ----
  for (const VesselClass cls : {VesselClass::Container, VesselClass::Tanker}) {
    const auto& r = vessel::capacityRange(cls);
    CHECK(r.cls == cls);
    CHECK(r.min < r.max);
    CHECK(r.sliderStep > 0.0);
    CHECK(r.minPrice < r.maxPrice);
  }
  CHECK(vessel::vesselClassId(VesselClass::Tanker) == "tanker");
  CHECK(std::string_view(vessel::capacityRange(VesselClass::Container).unit) == "TEU");

  // ---- Bounds are reproduced exactly ----
  {
    const auto lo = vessel::baseStats(VesselClass::Container, 2000.0);
    CHECK(lo.rangeNm == 10000.0);
    CHECK(lo.speedKn == 10.0);
    CHECK(lo.fuel == 158.0);
    CHECK(lo.co2 == 1.87);
    CHECK(lo.buildTimeSec == 24000.0);

    const auto hi = vessel::baseStats(VesselClass::Container, 27000.0);
    CHECK(hi.rangeNm == 742.0);
    CHECK(hi.speedKn == 28.0);
    CHECK(hi.fuel == 3562.0);
    CHECK(hi.co2 == 0.20);
    CHECK(hi.buildTimeSec == 172800.0);

    const auto tlo = vessel::baseStats(VesselClass::Tanker, 148000.0);
    CHECK(tlo.fuel == 157.0);
    CHECK(tlo.co2 == 1.90);

    const auto thi = vessel::baseStats(VesselClass::Tanker, 1998000.0);
    CHECK(thi.rangeNm == 742.0);
    CHECK(thi.fuel == 3537.0);
    CHECK(thi.co2 == 0.67);
  }

  // ---- Midpoint ----
  {
    const auto mid = vessel::baseStats(VesselClass::Container, 14500.0);
    CHECK_NEAR(mid.rangeNm, 5371.0, 1e-9);
    CHECK_NEAR(mid.speedKn, 19.0, 1e-9);
    CHECK_NEAR(mid.fuel, 1860.0, 1e-9);
    CHECK_NEAR(mid.co2, 1.035, 1e-12);
    CHECK_NEAR(mid.buildTimeSec, 98400.0, 1e-9);
  }

  // ---- Monotone in capacity ----
  {
    auto prev = vessel::baseStats(VesselClass::Tanker, 148000.0);
    for (double cap = 149000.0; cap <= 1998000.0; cap += 37000.0) {
      const auto s = vessel::baseStats(VesselClass::Tanker, cap);
      CHECK(s.rangeNm <= prev.rangeNm);
      CHECK(s.speedKn >= prev.speedKn);
      CHECK(s.fuel >= prev.fuel);
      CHECK(s.co2 <= prev.co2);
      CHECK(s.buildTimeSec >= prev.buildTimeSec);
      prev = s;
    }
  }

  // ---- Out-of-range capacities extrapolate ----
  {
    const auto below = vessel::baseStats(VesselClass::Container, 1000.0);
    CHECK_NEAR(below.rangeNm, 10370.32, 1e-6);
    CHECK(below.speedKn < 10.0);
    CHECK(!vessel::capacityInRange(VesselClass::Container, 1000.0));
    CHECK(vessel::capacityInRange(VesselClass::Container, 27000.0));
  }

  // ---- interpolate() edge cases ----
  CHECK(vessel::interpolate(5.0, 3.0, 3.0, 7.0, 9.0) == 7.0);
  CHECK(vessel::interpolate(3.0, 3.0, 5.0, 7.0, 9.0) == 7.0);
  CHECK(vessel::interpolate(5.0, 3.0, 5.0, 7.0, 9.0) == 9.0);

  // ---- Parsing ----
  {
    VesselClass cls = VesselClass::Container;
    CHECK(vessel::tryParseVesselClass(" Tanker ", cls) && cls == VesselClass::Tanker);
    CHECK(!vessel::tryParseVesselClass("bulk", cls));
    CHECK(cls == VesselClass::Tanker);
    CHECK(vessel::isKnownVesselClass(VesselClass::Container));
    CHECK(!vessel::isKnownVesselClass(static_cast<VesselClass>(7)));
  }

  return failures;
}
