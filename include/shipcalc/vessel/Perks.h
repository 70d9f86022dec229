#pragma once

#include "shipcalc/core/Types.h"
#include "shipcalc/vessel/BaseStats.h"

#include <cstddef>
#include <string_view>

namespace shipcalc::vessel {

// -----------------------------------------------------------------------------
// Perks: optional vessel modifications that trade price for a stat change
// -----------------------------------------------------------------------------
//
// Deltas are fractions (-0.10 == -10 %). Price factors are fractions of the
// vessel price (see VesselPrice.h). Keep enum values stable: they index the
// tables below.

enum class Antifouling : core::u8 {
  None  = 0,
  TypeA = 1,
  TypeB = 2,
};

enum class Propeller : core::u8 {
  FourBlade = 0, // default, no effect
  FiveBlade = 1,
  SixBlade  = 2,
};

struct AntifoulingDef {
  Antifouling type;
  const char* id;
  const char* name;
  double co2Delta;
  double fuelDelta;
  double priceFactor;
  double buildTimeSec;
};

struct BulbousBowDef {
  const char* name;
  double co2Delta;
  double fuelDelta;
  double priceFactor;
  double buildTimeSec;
};

struct PropellerDef {
  Propeller type;
  const char* id;
  const char* name;
  double speedDelta;
  double priceFactor;
};

struct EnhancedThrustersDef {
  const char* name;
  double fuelDelta;
  double pricePerCapacityUnit; // flat $ per TEU/BBL, outside the price factor
  double channelWaitFactor;    // informational: canal wait time multiplier
  double dockTimeFactor;       // informational: docking time multiplier
};

inline constexpr AntifoulingDef kAntifoulingDefs[] = {
  {Antifouling::None,  "",       "None",   0.00,  0.00, 0.000,   0.0},
  {Antifouling::TypeA, "type_a", "Type A", -0.10, 0.01, 0.021, 500.0},
  {Antifouling::TypeB, "type_b", "Type B", 0.10, -0.01, 0.021, 500.0},
};

inline constexpr BulbousBowDef kBulbousBow = {"Bulbous Bow", -0.03, -0.03, 0.082, 800.0};

inline constexpr PropellerDef kPropellerDefs[] = {
  {Propeller::FourBlade, "4_blade_propeller", "4 Blades", 0.00, 0.000},
  {Propeller::FiveBlade, "5_blade_propeller", "5 Blades", 0.08, 0.038},
  {Propeller::SixBlade,  "6_blade_propeller", "6 Blades", 0.12, 0.076},
};

inline constexpr EnhancedThrustersDef kEnhancedThrusters = {"Enhanced Thrusters", 0.01, 140.0, 0.96, 0.9};

struct PerkSelection {
  Antifouling antifouling{Antifouling::None};
  bool bulbousBow{false};
  Propeller propeller{Propeller::FourBlade};
  bool enhancedThrusters{false};
};

// Aborts on enum values outside the tables (caller defect).
const AntifoulingDef& antifoulingDef(Antifouling a);
const PropellerDef& propellerDef(Propeller p);

// Accept the wire ids ("type_a", "5_blade_propeller") and the short forms used by
// the CLI ("a", "b", "none", "4", "5", "6").
bool tryParseAntifouling(std::string_view text, Antifouling& out);
bool tryParsePropeller(std::string_view text, Propeller& out);

// Applies the selection to `base` in a fixed order; each step multiplies the
// running value left by the previous one:
//   1. antifouling        co2 *= 1+d, fuel *= 1+d, build time += s
//   2. bulbous bow        co2 *= 1+d, fuel *= 1+d, build time += s
//   3. propeller          speed *= 1+d
//   4. enhanced thrusters fuel *= 1+d
// Range is never modified. Enhanced thrusters only affect fuel here; their
// price is a flat capacity surcharge handled by the price calculator.
VesselStats applyPerks(const VesselStats& base, const PerkSelection& perks);

// Sum of the price factors of the active antifouling, bulbous bow and propeller.
// Enhanced thrusters do not contribute.
double perkPriceFactor(const PerkSelection& perks);

bool hasAnyPerk(const PerkSelection& perks);

} // namespace shipcalc::vessel
