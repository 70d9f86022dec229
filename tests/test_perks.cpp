#include "shipcalc/vessel/Perks.h"

#include "test_harness.h"

#include <string>

using namespace shipcalc;

int test_perks() {
  int failures = 0;

  using vessel::Antifouling;
  using vessel::Propeller;

  const vessel::VesselStats base{5000.0, 20.0, 1.0, 1.0, 0.0};

  // ---- No selection is the identity ----
  {
    const auto s = vessel::applyPerks(base, vessel::PerkSelection{});
    CHECK(s.rangeNm == base.rangeNm);
    CHECK(s.speedKn == base.speedKn);
    CHECK(s.fuel == base.fuel);
    CHECK(s.co2 == base.co2);
    CHECK(s.buildTimeSec == base.buildTimeSec);
    CHECK(!vessel::hasAnyPerk(vessel::PerkSelection{}));
    CHECK(vessel::perkPriceFactor(vessel::PerkSelection{}) == 0.0);
  }

  // ---- Antifouling A then bulbous bow compound multiplicatively ----
  {
    vessel::PerkSelection sel{};
    sel.antifouling = Antifouling::TypeA;
    sel.bulbousBow = true;
    const auto s = vessel::applyPerks(base, sel);
    CHECK_NEAR(s.co2, 1.0 * 0.90 * 0.97, 1e-12);
    CHECK_NEAR(s.fuel, 1.0 * 1.01 * 0.97, 1e-12);
    CHECK_NEAR(s.buildTimeSec, 1300.0, 1e-9);
    CHECK(s.rangeNm == base.rangeNm);
    CHECK(s.speedKn == base.speedKn);
  }

  // ---- Antifouling B trades CO2 for fuel ----
  {
    vessel::PerkSelection sel{};
    sel.antifouling = Antifouling::TypeB;
    const auto s = vessel::applyPerks(base, sel);
    CHECK_NEAR(s.co2, 1.10, 1e-12);
    CHECK_NEAR(s.fuel, 0.99, 1e-12);
  }

  // ---- Propellers only touch speed; thrusters only touch fuel ----
  {
    vessel::PerkSelection sel{};
    sel.propeller = Propeller::SixBlade;
    sel.enhancedThrusters = true;
    const auto s = vessel::applyPerks(base, sel);
    CHECK_NEAR(s.speedKn, 22.4, 1e-12);
    CHECK_NEAR(s.fuel, 1.01, 1e-12);
    CHECK(s.co2 == 1.0);
    CHECK(s.rangeNm == base.rangeNm);
    CHECK(vessel::hasAnyPerk(sel));
  }

  // ---- Price factors ----
  {
    vessel::PerkSelection sel{};
    sel.antifouling = Antifouling::TypeA;
    sel.bulbousBow = true;
    sel.propeller = Propeller::FiveBlade;
    CHECK_NEAR(vessel::perkPriceFactor(sel), 0.021 + 0.082 + 0.038, 1e-12);

    sel.enhancedThrusters = true;
    CHECK_NEAR(vessel::perkPriceFactor(sel), 0.021 + 0.082 + 0.038, 1e-12);
  }

  // ---- Parsing ----
  {
    Antifouling a = Antifouling::None;
    CHECK(vessel::tryParseAntifouling("a", a) && a == Antifouling::TypeA);
    CHECK(vessel::tryParseAntifouling("TYPE_B", a) && a == Antifouling::TypeB);
    CHECK(vessel::tryParseAntifouling("", a) && a == Antifouling::None);
    CHECK(!vessel::tryParseAntifouling("c", a));

    Propeller p = Propeller::FourBlade;
    CHECK(vessel::tryParsePropeller("6", p) && p == Propeller::SixBlade);
    CHECK(vessel::tryParsePropeller("5_blade_propeller", p) && p == Propeller::FiveBlade);
    CHECK(!vessel::tryParsePropeller("7", p));
    CHECK(!vessel::tryParsePropeller("", p));
    CHECK(p == Propeller::FiveBlade);

    CHECK(std::string(vessel::antifoulingDef(Antifouling::TypeA).id) == "type_a");
    CHECK(std::string(vessel::propellerDef(Propeller::FourBlade).id) == "4_blade_propeller");
  }

  return failures;
}
