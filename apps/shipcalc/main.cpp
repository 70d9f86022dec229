#include "shipcalc/core/Args.h"
#include "shipcalc/core/CVar.h"
#include "shipcalc/core/JsonWriter.h"
#include "shipcalc/core/Log.h"
#include "shipcalc/econ/RouteEconomics.h"
#include "shipcalc/econ/ShareTranche.h"
#include "shipcalc/vessel/BuildRequest.h"
#include "shipcalc/vessel/GameFormulas.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace shipcalc;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitValidation = 1;
constexpr int kExitUsage = 2;

const std::vector<std::string_view> kCommonKeys = {"config", "set", "log-level", "help", "h", "json"};

void printHelp() {
  std::cout << "shipcalc <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  vessel                 Quote a vessel build (stats + price)\n"
            << "  route                  Quote a route (fees, travel time, fuel)\n"
            << "  shares                 Share tranche tier for a number of issued shares\n"
            << "  engines                List engine models\n"
            << "  ports                  List shipyard delivery ports\n"
            << "\n"
            << "vessel:\n"
            << "  --class <c>            container | tanker (default: container)\n"
            << "  --capacity <n>         TEU or BBL (default: class minimum)\n"
            << "  --engine <id>          Engine model id (see 'shipcalc engines')\n"
            << "  --kw <n>               Engine power, clamped into the model's band (default: minKw)\n"
            << "  --antifouling <a|b>    Antifouling coating\n"
            << "  --bulbous              Fit a bulbous bow\n"
            << "  --propeller <4|5|6>    Propeller blades (default: 4)\n"
            << "  --thrusters            Fit enhanced thrusters\n"
            << "  --step <1..4>          Wizard step to price up to (default: 4 with an engine, else 1)\n"
            << "  --name <s>             Vessel name (needed for the build payload)\n"
            << "  --port <id>            Shipyard port id (see 'shipcalc ports')\n"
            << "\n"
            << "route:\n"
            << "  --class <c>            container | tanker (default: container)\n"
            << "  --capacity <n>         Vessel capacity (required)\n"
            << "  --distance <nm>        Route distance (required)\n"
            << "  --speed <kn>           Sailing speed (required)\n"
            << "  --fuel-factor <f>      Vessel fuel factor (default: cvar route.fuel_factor)\n"
            << "  --guards <n>           Guards hired (default: 0)\n"
            << "  --route-id <id>        Route id echoed in the JSON payload\n"
            << "\n"
            << "shares:\n"
            << "  --total <n>            Shares issued so far (required)\n"
            << "\n"
            << "Common:\n"
            << "  --json                 Emit JSON to stdout\n"
            << "  --config <path>        Load settings file (key = value)\n"
            << "  --set <key=value>      Override a setting (repeatable)\n"
            << "  --log-level <lvl>      trace | debug | info | warn | error | off\n"
            << "  -h, --help             Show this help\n";
}

// 17800000 -> "17,800,000"
std::string formatThousands(double v) {
  if (!std::isfinite(v) || std::fabs(v) >= 1e18) {
    std::ostringstream oss;
    oss << std::scientific << std::setprecision(3) << v;
    return oss.str();
  }
  const long long n = std::llround(v);
  std::string digits = std::to_string(n < 0 ? -n : n);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);
  const std::size_t lead = digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (i % 3) == lead % 3) out.push_back(',');
    out.push_back(digits[i]);
  }
  if (n < 0) out.insert(out.begin(), '-');
  return out;
}

std::string fixed(double v, int decimals) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(decimals) << v;
  return oss.str();
}

std::string formatMoney(double v) {
  return "$" + formatThousands(v);
}

// 3300 -> "00:55:00"; hours are not wrapped at 24.
std::string formatDuration(double seconds) {
  const long long total = std::max(0LL, std::llround(seconds));
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << (total / 3600) << ":"
      << std::setw(2) << ((total / 60) % 60) << ":"
      << std::setw(2) << (total % 60);
  return oss.str();
}

bool rejectUnknown(const core::Args& args, std::vector<std::string_view> known) {
  known.insert(known.end(), kCommonKeys.begin(), kCommonKeys.end());
  const auto unknown = args.unknownKeys(known);
  if (unknown.empty()) return false;
  for (const auto& k : unknown) {
    std::cerr << "Unknown option for '" << args.command() << "': --" << k << "\n";
  }
  return true;
}

// Reads a required/optional number. Returns false (after printing) on a malformed value.
bool readNumber(const core::Args& args, std::string_view key, double& out, bool required) {
  if (!args.has(key)) {
    if (required) {
      std::cerr << "Missing required option --" << key << "\n";
      return false;
    }
    return true;
  }
  if (!args.getDouble(key, out) || !std::isfinite(out)) {
    std::cerr << "Invalid --" << key << ": expected a number\n";
    return false;
  }
  return true;
}

bool readClass(const core::Args& args, vessel::VesselClass& cls) {
  std::string text;
  if (!args.getString("class", text)) return true;
  if (!vessel::tryParseVesselClass(text, cls)) {
    std::cerr << "Invalid --class: '" << text << "' (expected container | tanker)\n";
    return false;
  }
  return true;
}

bool jsonOutput(const core::Args& args) {
  return args.hasFlag("json") || core::cvars().getBool("output.json");
}

bool prettyJson() {
  return core::cvars().getBool("output.pretty", true);
}

void printStats(const vessel::VesselStats& s) {
  std::cout << "  range:       " << formatThousands(s.rangeNm) << " nm\n"
            << "  speed:       " << fixed(s.speedKn, 1) << " kn\n"
            << "  fuel:        " << fixed(s.fuel, 2) << "\n"
            << "  co2:         " << fixed(s.co2, 3) << "\n"
            << "  build time:  " << formatDuration(s.buildTimeSec) << "\n";
}

void writeQuoteJson(core::JsonWriter& w, const vessel::VesselBuildRequest& req, const vessel::VesselQuote& q) {
  w.beginObject();
  w.key("vessel_model"); w.value(vessel::vesselClassId(req.cls));
  w.key("capacity"); w.value(req.capacity);
  w.key("step"); w.value((int)q.step);
  w.key("engine_type");
  if (q.engineApplied) {
    w.value(req.engineId);
  } else {
    w.nullValue();
  }
  w.key("engine_kw"); w.value(q.engineApplied ? req.engineKw : 0.0);

  w.key("stats");
  w.beginObject();
  w.key("range"); w.value(q.stats.rangeNm);
  w.key("speed"); w.value(q.stats.speedKn);
  w.key("fuel"); w.value(q.stats.fuel);
  w.key("co2"); w.value(q.stats.co2);
  w.key("build_time"); w.value(q.stats.buildTimeSec);
  w.endObject();

  w.key("price");
  w.beginObject();
  w.key("base"); w.value(q.price.basePrice);
  w.key("engine"); w.value(q.price.enginePrice);
  w.key("vessel"); w.value(q.price.vesselPrice);
  w.key("perk_factor"); w.value(q.price.perkFactor);
  w.key("perk_cost"); w.value(q.price.perkCost);
  w.key("thrusters"); w.value(q.price.thrustersSurcharge);
  w.key("total"); w.value(q.price.total);
  w.endObject();

  w.endObject();
}

int runVessel(const core::Args& args) {
  if (rejectUnknown(args, {"class", "capacity", "engine", "kw", "antifouling", "bulbous", "propeller",
                           "thrusters", "step", "name", "port"})) {
    return kExitUsage;
  }

  vessel::VesselBuildRequest req{};
  vessel::VesselClass cls = vessel::VesselClass::Container;
  if (!readClass(args, cls)) return kExitUsage;
  vessel::setVesselClass(req, cls);
  if (!readNumber(args, "capacity", req.capacity, false)) return kExitUsage;

  const vessel::CapacityRange& range = vessel::capacityRange(req.cls);
  if (!vessel::capacityInRange(req.cls, req.capacity)) {
    std::ostringstream oss;
    oss << "capacity " << req.capacity << " is outside [" << range.min << ", " << range.max << "] "
        << range.unit << "; values are extrapolated";
    SHIPCALC_LOG_WARN(oss.str());
  }

  std::string engineId;
  if (args.getString("engine", engineId)) {
    if (!vessel::selectEngine(req, engineId)) {
      std::cerr << "Invalid --engine: '" << engineId << "'\nValid ids:";
      for (const auto& e : vessel::kEngineModels) std::cerr << " " << e.id;
      std::cerr << "\n";
      return kExitUsage;
    }
    double kw = req.engineKw;
    if (!readNumber(args, "kw", kw, false)) return kExitUsage;
    (void)vessel::setEngineKw(req, kw);
    if (req.engineKw != kw) {
      std::ostringstream oss;
      oss << "engine power " << kw << " kW clamped to " << req.engineKw << " kW";
      SHIPCALC_LOG_WARN(oss.str());
    }
  } else if (args.has("kw")) {
    std::cerr << "--kw needs --engine\n";
    return kExitUsage;
  }

  std::string text;
  if (args.getString("antifouling", text) && !vessel::tryParseAntifouling(text, req.perks.antifouling)) {
    std::cerr << "Invalid --antifouling: '" << text << "' (expected a | b)\n";
    return kExitUsage;
  }
  if (args.getString("propeller", text) && !vessel::tryParsePropeller(text, req.perks.propeller)) {
    std::cerr << "Invalid --propeller: '" << text << "' (expected 4 | 5 | 6)\n";
    return kExitUsage;
  }
  req.perks.bulbousBow = args.hasFlag("bulbous");
  req.perks.enhancedThrusters = args.hasFlag("thrusters");

  req.step = req.engineId.empty() ? vessel::BuildStep::Hull : vessel::BuildStep::Review;
  if (args.has("step")) {
    long long step = 0;
    if (!args.getInt("step", step) || step < 1 || step > 4) {
      std::cerr << "Invalid --step: expected 1..4\n";
      return kExitUsage;
    }
    req.step = (vessel::BuildStep)step;
  }
  if (req.step < vessel::BuildStep::Perks && vessel::hasAnyPerk(req.perks)) {
    SHIPCALC_LOG_INFO("perks are selected but not priced before step 3");
  }

  (void)args.getString("name", req.name);
  (void)args.getString("port", req.shipyardPort);
  const bool wantsPayload = args.has("name") || args.has("port");

  const vessel::VesselQuote quote = vessel::quoteBuild(req);

  if (wantsPayload) {
    const vessel::BuildValidation v = vessel::validateBuildRequest(req);
    if (!v.ok) {
      std::cerr << "Build request rejected: " << v.reason << "\n";
      return kExitValidation;
    }
  }

  if (jsonOutput(args)) {
    core::JsonWriter w(std::cout, prettyJson());
    if (wantsPayload) {
      vessel::writeBuildPayload(w, req, quote);
    } else {
      writeQuoteJson(w, req, quote);
    }
    std::cout << "\n";
    return kExitOk;
  }

  std::cout << vessel::vesselClassId(req.cls) << " " << formatThousands(req.capacity) << " " << range.unit
            << " (step " << (int)quote.step << ")\n";
  if (quote.engineApplied) {
    const vessel::EngineModel* e = vessel::requestEngine(req);
    std::cout << "  engine:      " << e->name << " @ " << formatThousands(req.engineKw) << " kW\n";
  }
  if (quote.perksApplied && vessel::hasAnyPerk(req.perks)) {
    std::cout << "  perks:      ";
    if (req.perks.antifouling != vessel::Antifouling::None) {
      std::cout << " antifouling " << vessel::antifoulingDef(req.perks.antifouling).name << ";";
    }
    if (req.perks.bulbousBow) std::cout << " " << vessel::kBulbousBow.name << ";";
    if (req.perks.propeller != vessel::Propeller::FourBlade) {
      std::cout << " " << vessel::propellerDef(req.perks.propeller).name << " propeller;";
    }
    if (req.perks.enhancedThrusters) std::cout << " " << vessel::kEnhancedThrusters.name << ";";
    std::cout << "\n";
  }
  printStats(quote.stats);

  std::cout << "  hull price:  " << formatMoney(quote.price.basePrice) << "\n";
  if (quote.engineApplied) {
    std::cout << "  engine:      " << formatMoney(quote.price.enginePrice) << "\n";
  }
  if (quote.perksApplied) {
    std::cout << "  perks:       " << formatMoney(quote.price.perkCost)
              << " (" << fixed(quote.price.perkFactor * 100.0, 1) << "%)\n";
    if (quote.price.thrustersSurcharge > 0.0) {
      std::cout << "  thrusters:   " << formatMoney(quote.price.thrustersSurcharge) << "\n";
    }
  }
  std::cout << "  total:       " << formatMoney(quote.price.total) << "\n";

  if (quote.engineApplied) {
    const double teu = vessel::gameTeuEquivalent(req.cls, req.capacity);
    const double speed = vessel::gameBaseSpeed(req.engineKw, teu);
    std::cout << "  game ref:    " << vessel::gameRange(req.engineKw, teu) << " nm, "
              << (quote.perksApplied ? vessel::gamePropellerSpeed(speed, req.perks.propeller) : speed)
              << " kn, " << vessel::gameFuelPerNm(teu, speed) << " kg/nm\n";
  }
  return kExitOk;
}

int runRoute(const core::Args& args) {
  if (rejectUnknown(args, {"class", "capacity", "distance", "speed", "fuel-factor", "guards", "route-id"})) {
    return kExitUsage;
  }

  econ::RouteParameters p{};
  if (!readClass(args, p.cls)) return kExitUsage;
  if (!readNumber(args, "capacity", p.capacity, true)) return kExitUsage;
  if (!readNumber(args, "distance", p.distanceNm, true)) return kExitUsage;
  if (!readNumber(args, "speed", p.speedKn, true)) return kExitUsage;

  p.fuelFactor = core::cvars().getFloat("route.fuel_factor", 1.0);
  if (!readNumber(args, "fuel-factor", p.fuelFactor, false)) return kExitUsage;

  if (args.has("guards")) {
    long long guards = 0;
    if (!args.getInt("guards", guards) || guards < 0 || guards > 1000) {
      std::cerr << "Invalid --guards: expected 0..1000\n";
      return kExitUsage;
    }
    p.guards = (int)guards;
  }

  if (p.distanceNm < 0.0 || p.capacity < 0.0) {
    std::cerr << "Route rejected: distance and capacity must not be negative\n";
    return kExitValidation;
  }
  if (p.speedKn <= 0.0 && p.distanceNm > econ::kNearRegimeNm) {
    SHIPCALC_LOG_WARN("non-positive speed: travel time and fuel are reported as 0");
  }

  const econ::RouteQuote q = econ::quoteRoute(p);

  if (jsonOutput(args)) {
    std::string routeId;
    (void)args.getString("route-id", routeId);
    core::JsonWriter w(std::cout, prettyJson());
    econ::writeRoutePayload(w, routeId, p, q);
    std::cout << "\n";
    return kExitOk;
  }

  std::cout << "route " << formatThousands(p.distanceNm) << " nm @ " << p.speedKn << " kn, "
            << vessel::vesselClassId(p.cls) << " " << formatThousands(p.capacity) << " "
            << vessel::capacityRange(p.cls).unit << "\n";
  std::cout << "  creation fee:  " << formatMoney(q.creationFee) << "\n"
            << "  travel time:   " << formatDuration(q.travelTimeSec) << "\n"
            << "  harbor fee:    $" << fixed(q.harborFee.min, 2) << " - $" << fixed(q.harborFee.max, 2)
            << " per unit\n"
            << "  fuel:          " << fixed(q.fuelTonnes, 2) << " t\n";
  std::cout << "  guards:        " << p.guards << " (" << formatMoney(q.guardsCost) << ")\n";

  if (const auto rate = econ::referenceFuelRate(p.capacity, p.cls, p.speedKn, p.fuelFactor)) {
    std::cout << "  ref fuel rate: " << fixed(rate->kgPerNm, 2) << " kg/nm, trip "
              << fixed(econ::tripFuelTonnes(*rate, p.distanceNm, p.speedKn), 2) << " t\n";
  }
  return kExitOk;
}

int runShares(const core::Args& args) {
  if (rejectUnknown(args, {"total"})) return kExitUsage;

  double total = 0.0;
  if (!readNumber(args, "total", total, true)) return kExitUsage;
  if (total < 0.0) {
    std::cerr << "Invalid --total: must not be negative\n";
    return kExitValidation;
  }

  econ::ShareTrancheSchedule schedule{};
  schedule.basePrice = core::cvars().getFloat("shares.base_price", schedule.basePrice);
  const std::int64_t trancheSize = core::cvars().getInt("shares.tranche_size", 25000);
  if (trancheSize <= 0) {
    std::cerr << "Invalid setting shares.tranche_size: must be positive\n";
    return kExitUsage;
  }
  schedule.trancheSize = (double)trancheSize;
  schedule.firstTrancheSize = (double)trancheSize;

  const econ::ShareTierQuote q = econ::quoteShares(total, schedule);

  if (jsonOutput(args)) {
    core::JsonWriter w(std::cout, prettyJson());
    w.beginObject();
    w.key("total"); w.value(total);
    w.key("tier"); w.value((long long)q.tier);
    w.key("price"); w.value(q.price);
    w.key("shares_per_purchase"); w.value(q.sharesPerPurchase);
    w.key("tiers");
    w.beginArray();
    for (const auto& t : q.reached) {
      w.beginObject();
      w.key("tier"); w.value((long long)t.index);
      w.key("from"); w.value(t.fromShares);
      w.key("to"); w.value(t.toShares);
      w.key("price"); w.value(t.price);
      w.endObject();
    }
    w.endArray();
    w.key("next");
    w.beginObject();
    w.key("tier"); w.value((long long)q.next.index);
    w.key("from"); w.value(q.next.fromShares);
    w.key("price"); w.value(q.next.price);
    w.endObject();
    w.endObject();
    std::cout << "\n";
    return kExitOk;
  }

  std::cout << "shares issued: " << formatThousands(total) << "\n"
            << "  tier:          " << q.tier << "\n"
            << "  price:         " << formatMoney(q.price) << " per " << formatThousands(q.sharesPerPurchase)
            << " shares\n";
  for (const auto& t : q.reached) {
    std::cout << "    tier " << t.index << ": " << formatThousands(t.fromShares) << " - "
              << formatThousands(t.toShares) << "  " << formatMoney(t.price) << "\n";
  }
  std::cout << "  next tier at:  " << formatThousands(q.next.fromShares) << " shares ("
            << formatMoney(q.next.price) << ")\n";
  return kExitOk;
}

int runEngines(const core::Args& args) {
  if (rejectUnknown(args, {})) return kExitUsage;

  if (jsonOutput(args)) {
    core::JsonWriter w(std::cout, prettyJson());
    w.beginArray();
    for (const auto& e : vessel::kEngineModels) {
      w.beginObject();
      w.key("id"); w.value(e.id);
      w.key("name"); w.value(e.name);
      w.key("min_kw"); w.value(e.minKw);
      w.key("max_kw"); w.value(e.maxKw);
      w.key("base_price"); w.value(e.basePrice);
      w.key("price_per_extra_kw"); w.value(e.pricePerExtraKw);
      w.key("default"); w.value(e.isDefault);
      w.endObject();
    }
    w.endArray();
    std::cout << "\n";
    return kExitOk;
  }

  for (const auto& e : vessel::kEngineModels) {
    std::cout << std::left << std::setw(16) << e.id << std::setw(16) << e.name << std::right
              << std::setw(7) << formatThousands(e.minKw) << " - " << std::setw(7) << formatThousands(e.maxKw)
              << " kW  " << std::setw(12) << formatMoney(e.basePrice)
              << " + " << formatMoney(e.pricePerExtraKw) << "/kW"
              << (e.isDefault ? "  (default)" : "") << "\n";
  }
  return kExitOk;
}

int runPorts(const core::Args& args) {
  if (rejectUnknown(args, {})) return kExitUsage;

  std::size_t count = 0;
  const vessel::ShipyardPort* ports = vessel::shipyardPorts(count);

  if (jsonOutput(args)) {
    core::JsonWriter w(std::cout, prettyJson());
    w.beginArray();
    for (std::size_t i = 0; i < count; ++i) {
      w.beginObject();
      w.key("id"); w.value(ports[i].id);
      w.key("label"); w.value(ports[i].label);
      w.endObject();
    }
    w.endArray();
    std::cout << "\n";
    return kExitOk;
  }

  for (std::size_t i = 0; i < count; ++i) {
    std::cout << std::left << std::setw(26) << ports[i].id << ports[i].label << "\n";
  }
  return kExitOk;
}

// Applies --config, --set and --log-level, in that order.
bool applySettings(const core::Args& args) {
  core::CVarRegistry& reg = core::cvars();

  std::string path;
  if (args.getString("config", path)) {
    std::string err;
    if (!reg.loadFile(path, &err)) {
      std::cerr << "Failed to load config '" << path << "': " << err << "\n";
      return false;
    }
    SHIPCALC_LOG_DEBUG("loaded settings from " + path);
  }

  for (const auto& assignment : args.values("set")) {
    std::string err;
    if (!reg.applyAssignment(assignment, &err)) {
      std::cerr << "Invalid --set '" << assignment << "': " << err << "\n";
      return false;
    }
  }

  std::string level;
  if (args.getString("log-level", level)) {
    core::LogLevel parsed = core::LogLevel::Info;
    if (!core::tryParseLogLevel(level, parsed)) {
      std::cerr << "Invalid --log-level: '" << level << "'\n";
      return false;
    }
    (void)reg.setFromString("log.level", level);
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);
  core::installDefaultCVars();

  core::Args args;
  for (const char* f : {"json", "bulbous", "thrusters", "help", "h"}) args.setFlagOnly(f);
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h") || args.command().empty()) {
    printHelp();
    return args.command().empty() && !(args.hasFlag("help") || args.hasFlag("h")) ? kExitUsage : kExitOk;
  }

  if (!applySettings(args)) return kExitUsage;

  const std::string& cmd = args.command();
  if (cmd == "vessel") return runVessel(args);
  if (cmd == "route") return runRoute(args);
  if (cmd == "shares") return runShares(args);
  if (cmd == "engines") return runEngines(args);
  if (cmd == "ports") return runPorts(args);

  std::cerr << "Unknown command: '" << cmd << "' (try --help)\n";
  return kExitUsage;
}
