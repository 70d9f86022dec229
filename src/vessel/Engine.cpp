#include "shipcalc/vessel/Engine.h"

#include "shipcalc/core/Assert.h"

#include <algorithm>
#include <string>

namespace shipcalc::vessel {

const EngineModel* findEngine(std::string_view id) {
  for (const auto& e : kEngineModels) {
    if (id == e.id) return &e;
  }
  return nullptr;
}

const EngineModel& engineModel(std::string_view id) {
  const EngineModel* e = findEngine(id);
  if (!e) {
    SHIPCALC_PANIC("engineModel: unknown engine id '" + std::string(id) + "'");
  }
  return *e;
}

const EngineModel& defaultEngine() {
  for (const auto& e : kEngineModels) {
    if (e.isDefault) return e;
  }
  return kEngineModels[0];
}

bool engineKwInBand(const EngineModel& engine, double engineKw) {
  return engineKw >= engine.minKw && engineKw <= engine.maxKw;
}

double clampEngineKw(const EngineModel& engine, double engineKw) {
  return std::clamp(engineKw, engine.minKw, engine.maxKw);
}

double toContainerCapacity(VesselClass cls, double capacity) {
  const CapacityRange& native = capacityRange(cls);
  const CapacityRange& container = capacityRange(VesselClass::Container);
  if (cls == VesselClass::Container) return capacity;
  return interpolate(capacity, native.min, native.max, container.min, container.max);
}

EnginePerformance interpolateEngine(VesselClass cls, double capacity, const EngineModel& engine, double engineKw) {
  SHIPCALC_ASSERT_MSG(engineKwInBand(engine, engineKw),
                      "interpolateEngine: engineKw outside the engine's [minKw, maxKw] band");

  const CapacityRange& container = capacityRange(VesselClass::Container);
  const double containerCapacity = toContainerCapacity(cls, capacity);

  // kW axis first, at both capacity corners.
  const double rangeAtMinCap = interpolate(engineKw, engine.minKw, engine.maxKw,
                                           engine.minCapMinKw.rangeNm, engine.minCapMaxKw.rangeNm);
  const double speedAtMinCap = interpolate(engineKw, engine.minKw, engine.maxKw,
                                           engine.minCapMinKw.speedKn, engine.minCapMaxKw.speedKn);
  const double rangeAtMaxCap = interpolate(engineKw, engine.minKw, engine.maxKw,
                                           engine.maxCapMinKw.rangeNm, engine.maxCapMaxKw.rangeNm);
  const double speedAtMaxCap = interpolate(engineKw, engine.minKw, engine.maxKw,
                                           engine.maxCapMinKw.speedKn, engine.maxCapMaxKw.speedKn);

  // Then the capacity axis.
  EnginePerformance out{};
  out.rangeNm = interpolate(containerCapacity, container.min, container.max, rangeAtMinCap, rangeAtMaxCap);
  out.speedKn = interpolate(containerCapacity, container.min, container.max, speedAtMinCap, speedAtMaxCap);
  return out;
}

} // namespace shipcalc::vessel
