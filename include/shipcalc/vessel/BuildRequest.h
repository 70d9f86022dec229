#pragma once

#include "shipcalc/core/JsonWriter.h"
#include "shipcalc/core/Types.h"
#include "shipcalc/vessel/BaseStats.h"
#include "shipcalc/vessel/Engine.h"
#include "shipcalc/vessel/Perks.h"
#include "shipcalc/vessel/VesselPrice.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace shipcalc::vessel {

// -----------------------------------------------------------------------------
// Vessel build request (headless build wizard)
// -----------------------------------------------------------------------------
//
// The build wizard collects a vessel configuration step by step. Stats and price
// are staged identically, so a UI can show a running total:
//   Hull   (1): base stats, hull price
//   Engine (2): engine speed/range replace the base values, engine price added
//   Perks  (3): perks composed into stats and priced
//   Review (4): same numbers as Perks; the request can be submitted

enum class BuildStep : core::u8 {
  Hull   = 1,
  Engine = 2,
  Perks  = 3,
  Review = 4,
};

inline constexpr std::size_t kMaxVesselNameLength = 50;
inline constexpr double kEngineKwSliderStep = 100.0;

struct ShipyardPort {
  const char* id;
  const char* label;
};

// Ports where newly built vessels can be delivered, in display order.
const ShipyardPort* shipyardPorts(std::size_t& count);
const ShipyardPort* findShipyardPort(std::string_view id);
bool isShipyardPort(std::string_view id);

struct VesselBuildRequest {
  BuildStep step{BuildStep::Hull};
  VesselClass cls{VesselClass::Container};
  double capacity{2000.0};

  // Empty until an engine is chosen.
  std::string engineId;
  double engineKw{0.0};

  PerkSelection perks{};

  std::string name;
  std::string shipyardPort;
};

// Switches class and resets capacity to the new class minimum.
void setVesselClass(VesselBuildRequest& req, VesselClass cls);

// Selects an engine and resets engineKw to its minKw. Returns false (request
// unchanged) for an unknown id.
bool selectEngine(VesselBuildRequest& req, std::string_view engineId);

// Sets engineKw clamped into the selected engine's band. Returns false if no
// engine is selected.
bool setEngineKw(VesselBuildRequest& req, double engineKw);

// The engine referenced by the request, or nullptr when none/unknown.
const EngineModel* requestEngine(const VesselBuildRequest& req);

struct VesselQuote {
  BuildStep step{BuildStep::Hull};
  VesselStats stats{};
  PriceBreakdown price{};
  bool engineApplied{false};
  bool perksApplied{false};
};

// Runs the staged pipeline for the request's current step. The request's
// engineKw is clamped into the band before interpolation.
VesselQuote quoteBuild(const VesselBuildRequest& req);

struct BuildValidation {
  bool ok{false};
  const char* reason{nullptr}; // static string, null when ok
};

// Checks a request before submission; reports the first problem found.
BuildValidation validateBuildRequest(const VesselBuildRequest& req);

// Writes the JSON body consumed by the vessel-build endpoint.
void writeBuildPayload(core::JsonWriter& w, const VesselBuildRequest& req, const VesselQuote& quote);

} // namespace shipcalc::vessel
