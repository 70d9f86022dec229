#include "shipcalc/vessel/VesselPrice.h"

#include "test_harness.h"

using namespace shipcalc;

int test_vessel_price() {
  int failures = 0;

  using vessel::VesselClass;

  // ---- Hull price bounds ----
  CHECK(vessel::basePrice(VesselClass::Container, 2000.0) == 17800000.0);
  CHECK(vessel::basePrice(VesselClass::Container, 27000.0) == 240300000.0);
  CHECK(vessel::basePrice(VesselClass::Tanker, 148000.0) == 17800000.0);
  CHECK(vessel::basePrice(VesselClass::Tanker, 1998000.0) == 240300000.0);

  // ---- Engine price ----
  const auto& x1 = vessel::engineModel("mih_x1");
  CHECK(vessel::enginePrice(x1, x1.minKw) == x1.basePrice);
  CHECK_NEAR(vessel::enginePrice(x1, 3500.0), 2915500.0, 1e-6);

  // ---- Hull only ----
  {
    const auto p = vessel::priceVessel(VesselClass::Container, 2000.0, nullptr, 0.0, nullptr);
    CHECK(p.enginePrice == 0.0);
    CHECK(p.perkCost == 0.0);
    CHECK(p.total == 17800000.0);
  }

  // ---- Hull + engine ----
  {
    const auto p = vessel::priceVessel(VesselClass::Container, 2000.0, &x1, 3500.0, nullptr);
    CHECK_NEAR(p.vesselPrice, 20715500.0, 1e-6);
    CHECK_NEAR(p.total, 20715500.0, 1e-6);
  }

  // ---- Perks are a fraction of hull + engine ----
  {
    vessel::PerkSelection sel{};
    sel.antifouling = vessel::Antifouling::TypeA;
    sel.bulbousBow = true;
    const auto p = vessel::priceVessel(VesselClass::Container, 2000.0, &x1, 3500.0, &sel);
    CHECK_NEAR(p.perkFactor, 0.103, 1e-12);
    CHECK_NEAR(p.perkCost, 20715500.0 * 0.103, 1e-6);
    CHECK_NEAR(p.total, 20715500.0 * 1.103, 1e-6);
    CHECK(p.thrustersSurcharge == 0.0);
  }

  // ---- Thrusters are a flat capacity surcharge outside the factor ----
  {
    vessel::PerkSelection sel{};
    sel.enhancedThrusters = true;
    const auto p = vessel::priceVessel(VesselClass::Container, 2000.0, &x1, 2500.0, &sel);
    CHECK(p.perkFactor == 0.0);
    CHECK(p.thrustersSurcharge == 280000.0);
    CHECK_NEAR(p.total, 17800000.0 + 2082500.0 + 280000.0, 1e-6);

    const auto t = vessel::priceVessel(VesselClass::Tanker, 148000.0, &x1, 2500.0, &sel);
    CHECK(t.thrustersSurcharge == 148000.0 * 140.0);
  }

  return failures;
}
