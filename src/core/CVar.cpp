#include "shipcalc/core/CVar.h"

#include "shipcalc/core/Log.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace shipcalc::core {

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

static std::string lowerAscii(std::string_view s) {
  std::string out(s.size(), '\0');
  for (std::size_t i = 0; i < s.size(); ++i) {
    out[i] = (char)std::tolower((unsigned char)s[i]);
  }
  return out;
}

static bool parseBool(std::string_view s, bool& out) {
  const std::string k = lowerAscii(trimView(s));
  if (k == "1" || k == "true" || k == "on" || k == "yes") { out = true; return true; }
  if (k == "0" || k == "false" || k == "off" || k == "no") { out = false; return true; }
  return false;
}

static bool parseInt(std::string_view s, std::int64_t& out) {
  s = trimView(s);
  if (s.empty()) return false;

  std::int64_t v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc{} || res.ptr != end) return false;
  out = v;
  return true;
}

static bool parseFloat(std::string_view s, double& out) {
  s = trimView(s);
  if (s.empty()) return false;

  // strtod needs a null-terminated buffer.
  const std::string tmp(s);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (!end || (std::size_t)(end - tmp.c_str()) != tmp.size()) return false;
  out = v;
  return true;
}

static std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() >= 2) {
    const char q0 = s.front();
    const char q1 = s.back();
    if ((q0 == '"' && q1 == '"') || (q0 == '\'' && q1 == '\'')) {
      s = s.substr(1, s.size() - 2);
    }
  }

  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '\\' && i + 1 < s.size()) {
      const char n = s[i + 1];
      if (n == '\\' || n == '"' || n == '\'') { out.push_back(n); ++i; continue; }
      if (n == 'n') { out.push_back('\n'); ++i; continue; }
      if (n == 't') { out.push_back('\t'); ++i; continue; }
    }
    out.push_back(c);
  }
  return out;
}

static std::string quoteIfNeeded(std::string_view s) {
  const bool needs = s.empty() || std::any_of(s.begin(), s.end(), [](char c) {
    return std::isspace((unsigned char)c) || c == '#' || c == '=' || c == '"' || c == '\\';
  });
  if (!needs) return std::string(s);

  std::string out = "\"";
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default: out.push_back(c); break;
    }
  }
  out.push_back('"');
  return out;
}

// Strips "# ..." and "// ..." comments that are not inside quotes.
static std::string_view stripComment(std::string_view sv) {
  bool inQuote = false;
  for (std::size_t i = 0; i < sv.size(); ++i) {
    const char c = sv[i];
    if (c == '"') inQuote = !inQuote;
    if (inQuote) continue;
    if (c == '#') return sv.substr(0, i);
    if (c == '/' && i + 1 < sv.size() && sv[i + 1] == '/') return sv.substr(0, i);
  }
  return sv;
}

static bool splitAssignment(std::string_view sv, std::string_view& name, std::string_view& val) {
  const std::size_t eq = sv.find('=');
  if (eq != std::string_view::npos) {
    name = trimView(sv.substr(0, eq));
    val = trimView(sv.substr(eq + 1));
  } else {
    std::size_t sp = 0;
    while (sp < sv.size() && !std::isspace((unsigned char)sv[sp])) ++sp;
    name = trimView(sv.substr(0, sp));
    val = trimView(sp < sv.size() ? sv.substr(sp) : std::string_view{});
  }
  return !name.empty();
}

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? &it->second : nullptr;
}

CVar* CVarRegistry::defineImpl(std::string_view name, CVarType type, CVarValue def,
                               std::uint32_t flags, std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = vars_.find(name);
  if (it == vars_.end()) {
    CVar v;
    v.name = std::string(name);
    v.type = type;
    v.value = def;
    it = vars_.emplace(v.name, std::move(v)).first;
  } else if (it->second.type != type) {
    return nullptr;
  }

  CVar& var = it->second;
  var.flags = flags;
  if (!help.empty()) var.help = std::string(help);
  var.defaultValue = std::move(def);

  const auto pit = pending_.find(var.name);
  if (pit != pending_.end()) {
    const std::string text = pit->second;
    pending_.erase(pit);
    std::string err;
    if (!assignLocked(var, text, &err)) {
      // Logging under the registry lock is fine: the logger has its own mutex.
      log(LogLevel::Warn, "cvar " + var.name + ": ignoring pending value (" + err + ")");
    }
  }
  return &var;
}

CVar* CVarRegistry::defineBool(std::string_view name, bool defaultValue,
                               std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Bool, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue,
                              std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Int, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue,
                                std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Float, CVarValue{defaultValue}, flags, help);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue,
                                 std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::String, CVarValue{std::move(defaultValue)}, flags, help);
}

bool CVarRegistry::assignLocked(CVar& var, std::string_view text, std::string* outError) {
  switch (var.type) {
    case CVarType::Bool: {
      bool b = false;
      if (!parseBool(text, b)) {
        if (outError) *outError = "Invalid bool: " + std::string(text);
        return false;
      }
      var.value = b;
      return true;
    }
    case CVarType::Int: {
      std::int64_t i = 0;
      if (!parseInt(text, i)) {
        if (outError) *outError = "Invalid int: " + std::string(text);
        return false;
      }
      var.value = i;
      return true;
    }
    case CVarType::Float: {
      double f = 0.0;
      if (!parseFloat(text, f)) {
        if (outError) *outError = "Invalid float: " + std::string(text);
        return false;
      }
      var.value = f;
      return true;
    }
    case CVarType::String:
      var.value = unquote(text);
      return true;
  }
  if (outError) *outError = "Unknown cvar type.";
  return false;
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  CVar snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    if ((it->second.flags & CVar_ReadOnly) != 0u) {
      if (outError) *outError = "CVar is read-only: " + it->second.name;
      return false;
    }
    if (!assignLocked(it->second, value, outError)) return false;
    snapshot = it->second;
  }

  // Notify outside the lock so listeners may read the registry.
  for (const auto& cb : snapshot.listeners) {
    if (cb) cb(snapshot);
  }
  return true;
}

bool CVarRegistry::applyAssignment(std::string_view assignment, std::string* outError) {
  std::string_view name;
  std::string_view val;
  const std::size_t eq = assignment.find('=');
  if (eq == std::string_view::npos || !splitAssignment(assignment, name, val)) {
    if (outError) *outError = "Expected name=value, got: " + std::string(assignment);
    return false;
  }
  return setFromString(name, val, outError);
}

bool CVarRegistry::reset(std::string_view name, std::string* outError) {
  CVar snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "Unknown cvar: " + std::string(name);
      return false;
    }
    it->second.value = it->second.defaultValue;
    snapshot = it->second;
  }

  for (const auto& cb : snapshot.listeners) {
    if (cb) cb(snapshot);
  }
  return true;
}

bool CVarRegistry::addListener(std::string_view name, CVarListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

template <class T>
static T getTyped(const std::map<std::string, CVar, std::less<>>& vars, std::string_view name, T fallback) {
  const auto it = vars.find(name);
  if (it == vars.end()) return fallback;
  if (!std::holds_alternative<T>(it->second.value)) return fallback;
  return std::get<T>(it->second.value);
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getTyped<bool>(vars_, name, fallback);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getTyped<std::int64_t>(vars_, name, fallback);
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getTyped<double>(vars_, name, fallback);
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return getTyped<std::string>(vars_, name, std::string(fallback));
}

std::vector<const CVar*> CVarRegistry::list(std::string_view filter) const {
  const std::string needle = lowerAscii(filter);
  std::vector<const CVar*> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(vars_.size());
  for (const auto& kv : vars_) {
    if (!needle.empty() && lowerAscii(kv.first).find(needle) == std::string::npos) continue;
    out.push_back(&kv.second);
  }
  return out;
}

const char* CVarRegistry::typeName(CVarType t) {
  switch (t) {
    case CVarType::Bool: return "bool";
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string CVarRegistry::valueToString(const CVar& v) {
  switch (v.type) {
    case CVarType::Bool:
      return std::get<bool>(v.value) ? "true" : "false";
    case CVarType::Int:
      return std::to_string(std::get<std::int64_t>(v.value));
    case CVarType::Float: {
      std::ostringstream oss;
      oss.precision(17);
      oss << std::get<double>(v.value);
      return oss.str();
    }
    case CVarType::String:
      return std::get<std::string>(v.value);
  }
  return {};
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open config file: " + path;
    return false;
  }

  std::ostringstream errs;
  bool hadErrors = false;

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;

    const std::string_view sv = trimView(stripComment(line));
    if (sv.empty()) continue;

    std::string_view name;
    std::string_view val;
    if (!splitAssignment(sv, name, val)) continue;

    bool known = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      known = vars_.find(name) != vars_.end();
      if (!known) pending_[std::string(name)] = std::string(val);
    }

    if (known) {
      std::string err;
      if (!setFromString(name, val, &err)) {
        hadErrors = true;
        errs << path << ":" << lineNo << ": " << err << "\n";
      }
    }
  }

  if (hadErrors && outError) *outError = errs.str();
  return !hadErrors;
}

bool CVarRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }

  out << "# shipcalc settings\n\n";

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : vars_) {
    const CVar& v = kv.second;
    if ((v.flags & CVar_Archive) == 0u) continue;

    out << v.name << " = ";
    if (v.type == CVarType::String) {
      out << quoteIfNeeded(std::get<std::string>(v.value));
    } else {
      out << valueToString(v);
    }
    out << "\n";
  }

  if (!pending_.empty()) {
    out << "\n# Unknown at save time\n";
    for (const auto& kv : pending_) {
      out << kv.first << " = " << quoteIfNeeded(unquote(kv.second)) << "\n";
    }
  }

  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }
  return true;
}

bool CVarRegistry::hasPending(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(name) != pending_.end();
}

std::optional<std::string> CVarRegistry::pendingValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

CVarRegistry& cvars() {
  static CVarRegistry g;
  return g;
}

void installDefaultCVars(CVarRegistry& registry) {
  if (!registry.exists("log.level")) {
    registry.defineString("log.level", "info", CVar_Archive,
                          "Global log level: trace|debug|info|warn|error|off");
    registry.addListener("log.level", [](const CVar& cv) {
      LogLevel lvl = LogLevel::Info;
      if (!tryParseLogLevel(std::get<std::string>(cv.value), lvl)) {
        SHIPCALC_LOG_WARN("cvar log.level: invalid value (expected trace|debug|info|warn|error|off)");
        return;
      }
      setLogLevel(lvl);
    });
  }

  if (!registry.exists("log.timestamps")) {
    registry.defineBool("log.timestamps", true, CVar_Archive, "Prefix log lines with a wall-clock timestamp.");
    registry.addListener("log.timestamps", [](const CVar& cv) {
      setLogTimestamps(std::get<bool>(cv.value));
    });
  }

  registry.defineBool("output.json", false, CVar_Archive, "Print JSON request payloads instead of reports.");
  registry.defineBool("output.pretty", true, CVar_Archive, "Indent JSON output.");
  registry.defineFloat("route.fuel_factor", 1.0, CVar_Archive, "Default vessel fuel factor for route quotes.");
  registry.defineFloat("shares.base_price", 6250000.0, CVar_Archive, "Price of the first share tranche ($).");
  registry.defineInt("shares.tranche_size", 25000, CVar_Archive, "Shares per tranche (also the IPO float).");
}

void installDefaultCVars() { installDefaultCVars(cvars()); }

} // namespace shipcalc::core
