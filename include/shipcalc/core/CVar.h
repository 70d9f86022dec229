#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shipcalc::core {

// Console variables ("CVars"): named, typed runtime settings for the shipcalc tool.
//
// Values come from three places, applied in this order by the CLI:
//   1. defaults registered by installDefaultCVars()
//   2. a line-based config file (loadFile)
//   3. "--set key=value" overrides (applyAssignment)
//
// Iteration order is name-sorted so listings and saved files are stable.

enum class CVarType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

enum CVarFlags : std::uint32_t {
  CVar_None     = 0u,
  CVar_Archive  = 1u << 0, // include in saveFile()
  CVar_ReadOnly = 1u << 1, // cannot be changed after definition
};

using CVarValue = std::variant<bool, std::int64_t, double, std::string>;
using CVarListener = std::function<void(const struct CVar&)>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};
  std::uint32_t flags{CVar_None};

  CVarValue value{};
  CVarValue defaultValue{};

  // Called after a successful set/reset.
  std::vector<CVarListener> listeners;
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Definition is idempotent. Redefining with a different type returns nullptr.
  // A pending assignment from loadFile() is applied on definition.
  CVar* defineBool(std::string_view name, bool defaultValue,
                   std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineInt(std::string_view name, std::int64_t defaultValue,
                  std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineFloat(std::string_view name, double defaultValue,
                    std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineString(std::string_view name, std::string defaultValue,
                     std::uint32_t flags = CVar_Archive, std::string_view help = {});

  bool        getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double      getFloat(std::string_view name, double fallback = 0.0) const;
  std::string getString(std::string_view name, std::string_view fallback = {}) const;

  // Parse `value` according to the variable's type and assign it.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  // "name=value" (whitespace around either side is ignored).
  bool applyAssignment(std::string_view assignment, std::string* outError = nullptr);

  bool reset(std::string_view name, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener cb, std::string* outError = nullptr);

  // Name-sorted. `filter` is a case-insensitive substring match when non-empty.
  std::vector<const CVar*> list(std::string_view filter = {}) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVar& v);

  // Config file format:
  //   # comment
  //   output.json = true
  //   route.fuel_factor = 0.9   # trailing comment
  //   log.level = "debug"
  //
  // Unknown names are kept as pending assignments until defined.
  bool loadFile(const std::string& path, std::string* outError = nullptr);
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

  bool hasPending(std::string_view name) const;
  std::optional<std::string> pendingValue(std::string_view name) const;

private:
  CVar* defineImpl(std::string_view name, CVarType type, CVarValue def,
                   std::uint32_t flags, std::string_view help);

  bool assignLocked(CVar& var, std::string_view text, std::string* outError);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

// Process-wide registry used by the shipcalc tool.
CVarRegistry& cvars();

// Registers the shipcalc defaults (safe to call multiple times):
//   log.level          string  "info"       trace|debug|info|warn|error|off
//   log.timestamps     bool    true
//   output.json        bool    false        print JSON payloads instead of reports
//   output.pretty      bool    true         indent JSON output
//   route.fuel_factor  float   1.0          default vessel fuel factor for route quotes
//   shares.base_price  float   6250000      price of the first share tranche
//   shares.tranche_size int    25000        shares per tranche (and IPO float)
void installDefaultCVars(CVarRegistry& registry);
void installDefaultCVars();

} // namespace shipcalc::core
