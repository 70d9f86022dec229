#include "shipcalc/vessel/Engine.h"

#include "test_harness.h"

#include <string>

using namespace shipcalc;

int test_engine() {
  int failures = 0;

  using vessel::VesselClass;

  // ---- Catalogue ----
  CHECK(vessel::engineModelCount() == 6);
  {
    int defaults = 0;
    int prevSort = 0;
    for (const auto& e : vessel::kEngineModels) {
      CHECK(e.minKw < e.maxKw);
      CHECK(e.pricePerExtraKw > 0.0);
      CHECK(e.sortOrder > prevSort);
      prevSort = e.sortOrder;
      if (e.isDefault) ++defaults;
      CHECK(vessel::findEngine(e.id) == &e);
    }
    CHECK(defaults == 1);
  }
  CHECK(std::string(vessel::defaultEngine().id) == "mih_x1");
  CHECK(vessel::findEngine("nope") == nullptr);
  CHECK(vessel::findEngine("") == nullptr);
  CHECK(&vessel::engineModel("man_p22l") == vessel::findEngine("man_p22l"));

  // ---- Band ----
  {
    const auto& x1 = vessel::engineModel("mih_x1");
    CHECK(vessel::engineKwInBand(x1, 2500.0));
    CHECK(vessel::engineKwInBand(x1, 11000.0));
    CHECK(!vessel::engineKwInBand(x1, 2499.0));
    CHECK(!vessel::engineKwInBand(x1, 11001.0));
    CHECK(vessel::clampEngineKw(x1, 100.0) == 2500.0);
    CHECK(vessel::clampEngineKw(x1, 99999.0) == 11000.0);
    CHECK(vessel::clampEngineKw(x1, 6000.0) == 6000.0);
  }

  // ---- Capacity re-mapping ----
  CHECK(vessel::toContainerCapacity(VesselClass::Container, 12345.0) == 12345.0);
  CHECK(vessel::toContainerCapacity(VesselClass::Tanker, 148000.0) == 2000.0);
  CHECK(vessel::toContainerCapacity(VesselClass::Tanker, 1998000.0) == 27000.0);
  CHECK_NEAR(vessel::toContainerCapacity(VesselClass::Tanker, 1073000.0), 14500.0, 1e-9);

  // ---- Corners are reproduced exactly, for both classes ----
  for (const auto& e : vessel::kEngineModels) {
    struct Corner {
      VesselClass cls;
      double cap;
      double kw;
      vessel::EngineCorner expect;
    };
    const Corner corners[] = {
      {VesselClass::Container, 2000.0,    e.minKw, e.minCapMinKw},
      {VesselClass::Container, 2000.0,    e.maxKw, e.minCapMaxKw},
      {VesselClass::Container, 27000.0,   e.minKw, e.maxCapMinKw},
      {VesselClass::Container, 27000.0,   e.maxKw, e.maxCapMaxKw},
      {VesselClass::Tanker,    148000.0,  e.minKw, e.minCapMinKw},
      {VesselClass::Tanker,    148000.0,  e.maxKw, e.minCapMaxKw},
      {VesselClass::Tanker,    1998000.0, e.minKw, e.maxCapMinKw},
      {VesselClass::Tanker,    1998000.0, e.maxKw, e.maxCapMaxKw},
    };
    for (const auto& c : corners) {
      const auto perf = vessel::interpolateEngine(c.cls, c.cap, e, c.kw);
      if (perf.rangeNm != c.expect.rangeNm || perf.speedKn != c.expect.speedKn) {
        std::cerr << "[test_engine] corner mismatch engine=" << e.id << " cap=" << c.cap << " kw=" << c.kw
                  << " got=(" << perf.rangeNm << ", " << perf.speedKn << ")\n";
        ++failures;
      }
    }
  }

  // ---- Centre of the domain ----
  {
    const auto& x1 = vessel::engineModel("mih_x1");
    const auto perf = vessel::interpolateEngine(VesselClass::Container, 14500.0, x1, 6750.0);
    // kW axis: (14000, 22) at 2000 TEU, (2000.5, 29) at 27000 TEU.
    CHECK_NEAR(perf.rangeNm, 8000.25, 1e-9);
    CHECK_NEAR(perf.speedKn, 25.5, 1e-9);

    const auto tanker = vessel::interpolateEngine(VesselClass::Tanker, 1073000.0, x1, 6750.0);
    CHECK_NEAR(tanker.rangeNm, perf.rangeNm, 1e-9);
    CHECK_NEAR(tanker.speedKn, perf.speedKn, 1e-9);
  }

  // ---- More power never hurts ----
  for (const auto& e : vessel::kEngineModels) {
    double prevRange = 0.0;
    double prevSpeed = 0.0;
    for (int i = 0; i <= 10; ++i) {
      const double kw = e.minKw + (e.maxKw - e.minKw) * (double)i / 10.0;
      const auto perf = vessel::interpolateEngine(VesselClass::Container, 9000.0, e, vessel::clampEngineKw(e, kw));
      CHECK(perf.rangeNm >= prevRange);
      CHECK(perf.speedKn >= prevSpeed);
      prevRange = perf.rangeNm;
      prevSpeed = perf.speedKn;
    }
  }

  return failures;
}
