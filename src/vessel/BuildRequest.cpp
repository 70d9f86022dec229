#include "shipcalc/vessel/BuildRequest.h"

#include "shipcalc/core/Log.h"

#include <array>
#include <cctype>
#include <cmath>
#include <sstream>

namespace shipcalc::vessel {

static const std::array<ShipyardPort, 35> kShipyardPorts = {{
  {"port_of_botany_sydney", "Australia, Port Of Botany Sydney"},
  {"freeport_container_port", "Bahamas, Freeport Container Port"},
  {"antwerpen", "Belgium, Antwerpen"},
  {"rio_de_janeiro", "Brazil, Rio De Janeiro"},
  {"varna", "Bulgaria, Varna"},
  {"shanghai", "China, Shanghai"},
  {"tianjin_xin_gang", "China, Tianjin Xin Gang"},
  {"port_said", "Egypt, Port Said"},
  {"port_of_le_havre", "France, Port Of Le Havre"},
  {"rade_de_brest", "France, Rade De Brest"},
  {"port_of_piraeus", "Greece, Port Of Piraeus"},
  {"genova", "Italy, Genova"},
  {"napoli", "Italy, Napoli"},
  {"porto_di_lido_venezia", "Italy, Porto Di Lido Venezia"},
  {"nagasaki", "Japan, Nagasaki"},
  {"osaka", "Japan, Osaka"},
  {"bayrut", "Lebanon, Bayrut"},
  {"johor", "Malaysia, Johor"},
  {"veracruz", "Mexico, Veracruz"},
  {"auckland", "New Zealand, Auckland"},
  {"gdansk", "Poland, Gdansk"},
  {"lisboa", "Portugal, Lisboa"},
  {"port_of_singapore", "Singapore, Port Of Singapore"},
  {"cape_town", "South Africa, Cape Town"},
  {"durban", "South Africa, Durban"},
  {"pusan", "South Korea, Pusan"},
  {"stockholm_norvik", "Sweden, Stockholm Norvik"},
  {"chi_lung", "Taiwan, Chi Lung"},
  {"belfast", "United Kingdom, Belfast"},
  {"southampton", "United Kingdom, Southampton"},
  {"baltimore", "United States, Baltimore"},
  {"boston_us", "United States, Boston Us"},
  {"mobile", "United States, Mobile"},
  {"oakland", "United States, Oakland"},
  {"philadelphia", "United States, Philadelphia"},
}};

const ShipyardPort* shipyardPorts(std::size_t& count) {
  count = kShipyardPorts.size();
  return kShipyardPorts.data();
}

const ShipyardPort* findShipyardPort(std::string_view id) {
  for (const auto& p : kShipyardPorts) {
    if (id == p.id) return &p;
  }
  return nullptr;
}

bool isShipyardPort(std::string_view id) {
  return findShipyardPort(id) != nullptr;
}

void setVesselClass(VesselBuildRequest& req, VesselClass cls) {
  req.cls = cls;
  req.capacity = capacityRange(cls).min;
}

bool selectEngine(VesselBuildRequest& req, std::string_view engineId) {
  const EngineModel* e = findEngine(engineId);
  if (!e) return false;
  req.engineId = e->id;
  req.engineKw = e->minKw;
  return true;
}

bool setEngineKw(VesselBuildRequest& req, double engineKw) {
  const EngineModel* e = requestEngine(req);
  if (!e) return false;
  req.engineKw = clampEngineKw(*e, engineKw);
  return true;
}

const EngineModel* requestEngine(const VesselBuildRequest& req) {
  if (req.engineId.empty()) return nullptr;
  return findEngine(req.engineId);
}

VesselQuote quoteBuild(const VesselBuildRequest& req) {
  VesselQuote q{};
  q.step = req.step;
  q.stats = baseStats(req.cls, req.capacity);

  const EngineModel* engine = nullptr;
  double engineKw = 0.0;
  if (req.step >= BuildStep::Engine) {
    engine = requestEngine(req);
    if (engine) {
      engineKw = clampEngineKw(*engine, req.engineKw);
      const EnginePerformance perf = interpolateEngine(req.cls, req.capacity, *engine, engineKw);
      q.stats.rangeNm = perf.rangeNm;
      q.stats.speedKn = perf.speedKn;
      q.engineApplied = true;
    }
  }

  const PerkSelection* perks = nullptr;
  if (req.step >= BuildStep::Perks) {
    perks = &req.perks;
    q.stats = applyPerks(q.stats, req.perks);
    q.perksApplied = true;
  }

  q.price = priceVessel(req.cls, req.capacity, engine, engineKw, perks);

  if (core::getLogLevel() <= core::LogLevel::Debug) {
    std::ostringstream oss;
    oss << "quoteBuild: " << vesselClassId(req.cls) << " cap=" << req.capacity
        << " step=" << (int)req.step
        << " engine=" << (engine ? engine->id : "-") << " kw=" << engineKw
        << " total=" << q.price.total;
    SHIPCALC_LOG_DEBUG(oss.str());
  }
  return q;
}

static bool isBlank(std::string_view s) {
  for (const unsigned char c : s) {
    if (!std::isspace(c)) return false;
  }
  return true;
}

BuildValidation validateBuildRequest(const VesselBuildRequest& req) {
  BuildValidation v{};
  if (!isKnownVesselClass(req.cls)) {
    v.reason = "unknown_vessel_class";
    return v;
  }
  if (isBlank(req.name)) {
    v.reason = "name_required";
    return v;
  }
  if (req.name.size() > kMaxVesselNameLength) {
    v.reason = "name_too_long";
    return v;
  }
  if (!isShipyardPort(req.shipyardPort)) {
    v.reason = "unknown_shipyard";
    return v;
  }
  if (!capacityInRange(req.cls, req.capacity)) {
    v.reason = "capacity_out_of_range";
    return v;
  }
  const EngineModel* engine = requestEngine(req);
  if (!engine) {
    v.reason = "engine_required";
    return v;
  }
  if (!engineKwInBand(*engine, req.engineKw)) {
    v.reason = "engine_kw_out_of_band";
    return v;
  }
  v.ok = true;
  return v;
}

void writeBuildPayload(core::JsonWriter& w, const VesselBuildRequest& req, const VesselQuote& quote) {
  w.beginObject();
  w.key("name"); w.value(req.name);
  w.key("ship_yard"); w.value(req.shipyardPort);
  w.key("vessel_model"); w.value(vesselClassId(req.cls));
  w.key("engine_type"); w.value(req.engineId);
  w.key("engine_kw"); w.value(req.engineKw);
  w.key("capacity"); w.value(req.capacity);

  w.key("antifouling_model");
  if (req.perks.antifouling == Antifouling::None) {
    w.nullValue();
  } else {
    w.value(antifoulingDef(req.perks.antifouling).id);
  }

  w.key("bulbous"); w.value(req.perks.bulbousBow ? 1 : 0);
  w.key("enhanced_thrusters"); w.value(req.perks.enhancedThrusters ? 1 : 0);
  w.key("range"); w.value(std::round(quote.stats.rangeNm));
  w.key("speed"); w.value(std::round(quote.stats.speedKn * 10.0) / 10.0);
  w.key("fuel_consumption"); w.value(std::round(quote.stats.fuel));
  w.key("propeller_types"); w.value(propellerDef(req.perks.propeller).id);
  w.key("build_price"); w.value(std::round(quote.price.total));
  w.endObject();
}

} // namespace shipcalc::vessel
