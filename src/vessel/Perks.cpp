#include "shipcalc/vessel/Perks.h"

#include "shipcalc/core/Assert.h"

#include <cctype>
#include <string>

namespace shipcalc::vessel {

static std::string normalizeToken(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const unsigned char c : s) {
    if (std::isspace(c)) continue;
    out.push_back((char)std::tolower(c));
  }
  return out;
}

const AntifoulingDef& antifoulingDef(Antifouling a) {
  const std::size_t idx = static_cast<std::size_t>(a);
  SHIPCALC_ASSERT_MSG(idx < sizeof(kAntifoulingDefs) / sizeof(kAntifoulingDefs[0]),
                      "antifoulingDef: unknown Antifouling value");
  return kAntifoulingDefs[idx];
}

const PropellerDef& propellerDef(Propeller p) {
  const std::size_t idx = static_cast<std::size_t>(p);
  SHIPCALC_ASSERT_MSG(idx < sizeof(kPropellerDefs) / sizeof(kPropellerDefs[0]),
                      "propellerDef: unknown Propeller value");
  return kPropellerDefs[idx];
}

bool tryParseAntifouling(std::string_view text, Antifouling& out) {
  const std::string tok = normalizeToken(text);
  if (tok.empty() || tok == "none" || tok == "null") { out = Antifouling::None; return true; }
  if (tok == "a" || tok == "type_a") { out = Antifouling::TypeA; return true; }
  if (tok == "b" || tok == "type_b") { out = Antifouling::TypeB; return true; }
  return false;
}

bool tryParsePropeller(std::string_view text, Propeller& out) {
  const std::string tok = normalizeToken(text);
  for (const auto& def : kPropellerDefs) {
    // Short form is the leading blade count ("4", "5", "6").
    if (tok == def.id || (tok.size() == 1 && tok[0] == def.id[0])) {
      out = def.type;
      return true;
    }
  }
  return false;
}

VesselStats applyPerks(const VesselStats& base, const PerkSelection& perks) {
  VesselStats s = base;

  if (perks.antifouling != Antifouling::None) {
    const AntifoulingDef& af = antifoulingDef(perks.antifouling);
    s.co2 *= (1.0 + af.co2Delta);
    s.fuel *= (1.0 + af.fuelDelta);
    s.buildTimeSec += af.buildTimeSec;
  }

  if (perks.bulbousBow) {
    s.co2 *= (1.0 + kBulbousBow.co2Delta);
    s.fuel *= (1.0 + kBulbousBow.fuelDelta);
    s.buildTimeSec += kBulbousBow.buildTimeSec;
  }

  s.speedKn *= (1.0 + propellerDef(perks.propeller).speedDelta);

  if (perks.enhancedThrusters) {
    s.fuel *= (1.0 + kEnhancedThrusters.fuelDelta);
  }

  return s;
}

double perkPriceFactor(const PerkSelection& perks) {
  double factor = 0.0;
  if (perks.antifouling != Antifouling::None) factor += antifoulingDef(perks.antifouling).priceFactor;
  if (perks.bulbousBow) factor += kBulbousBow.priceFactor;
  factor += propellerDef(perks.propeller).priceFactor;
  return factor;
}

bool hasAnyPerk(const PerkSelection& perks) {
  return perks.antifouling != Antifouling::None || perks.bulbousBow ||
         perks.propeller != Propeller::FourBlade || perks.enhancedThrusters;
}

} // namespace shipcalc::vessel
