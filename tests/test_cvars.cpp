#include "shipcalc/core/CVar.h"
#include "shipcalc/core/Log.h"

#include "test_harness.h"

#include <cstdio>
#include <string>

static void writeFile(const std::string& path, const char* text) {
  std::FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) return;
  std::fputs(text, f);
  std::fclose(f);
}

int test_cvars() {
  int failures = 0;

  using shipcalc::core::CVarRegistry;
  using shipcalc::core::CVarType;
  namespace core = shipcalc::core;

  // ---- Define + typed get/set ----
  {
    CVarRegistry r;
    CHECK(r.defineBool("a.bool", true, core::CVar_Archive, "test") != nullptr);
    CHECK(r.defineInt("a.int", 42, core::CVar_None) != nullptr);
    CHECK(r.defineFloat("a.float", 1.5, core::CVar_None) != nullptr);
    CHECK(r.defineString("a.str", "hello") != nullptr);

    CHECK(r.getBool("a.bool", false) == true);
    CHECK(r.getInt("a.int", 0) == 42);
    CHECK_NEAR(r.getFloat("a.float", 0.0), 1.5, 1e-12);
    CHECK(r.getString("a.str", "") == "hello");

    std::string err;
    CHECK(r.setFromString("a.bool", "off", &err));
    CHECK(r.getBool("a.bool", true) == false);
    CHECK(r.setFromString("a.int", "-7", &err));
    CHECK(r.getInt("a.int", 0) == -7);
    CHECK(r.setFromString("a.str", "\"hi there\"", &err));
    CHECK(r.getString("a.str", "") == "hi there");

    // Malformed values leave the variable untouched.
    CHECK(!r.setFromString("a.int", "12abc", &err));
    CHECK(r.getInt("a.int", 0) == -7);
    CHECK(!r.setFromString("a.float", "fast", &err));
    CHECK(!r.setFromString("missing", "1", &err));

    // Same name, different type.
    CHECK(r.defineString("a.int", "x") == nullptr);

    // Wrong-typed getter falls back.
    CHECK(r.getInt("a.str", 5) == 5);
  }

  // ---- Read-only, reset, assignments ----
  {
    CVarRegistry r;
    CHECK(r.defineInt("ro.value", 3, core::CVar_ReadOnly) != nullptr);
    std::string err;
    CHECK(!r.setFromString("ro.value", "4", &err));
    CHECK(!err.empty());
    CHECK(r.getInt("ro.value", 0) == 3);

    CHECK(r.defineFloat("route.fuel_factor", 1.0) != nullptr);
    CHECK(r.applyAssignment("  route.fuel_factor = 0.85 ", &err));
    CHECK_NEAR(r.getFloat("route.fuel_factor", 0.0), 0.85, 1e-12);
    CHECK(!r.applyAssignment("route.fuel_factor", &err));

    CHECK(r.reset("route.fuel_factor", &err));
    CHECK_NEAR(r.getFloat("route.fuel_factor", 0.0), 1.0, 1e-12);
  }

  // ---- Listeners fire after set and reset ----
  {
    CVarRegistry r;
    CHECK(r.defineBool("l.flag", false) != nullptr);
    int calls = 0;
    bool lastSeen = false;
    CHECK(r.addListener("l.flag", [&](const core::CVar& cv) {
      ++calls;
      lastSeen = std::get<bool>(cv.value);
    }));
    CHECK(r.setFromString("l.flag", "yes"));
    CHECK(calls == 1 && lastSeen);
    CHECK(r.reset("l.flag"));
    CHECK(calls == 2 && !lastSeen);
    CHECK(!r.addListener("l.missing", [](const core::CVar&) {}));
  }

  // ---- Pending assignment (load before define) ----
  {
    const std::string path = "shipcalc_test_cvars_pending.cfg";
    writeFile(path,
              "# test\n"
              "shares.tranche_size = 1000\n"
              "output.label = \"hello world\"\n");

    CVarRegistry r;
    std::string err;
    CHECK(r.loadFile(path, &err));
    CHECK(r.hasPending("shares.tranche_size"));
    CHECK(r.pendingValue("output.label").value_or("") == "\"hello world\"");

    CHECK(r.defineInt("shares.tranche_size", 25000) != nullptr);
    CHECK(r.defineString("output.label", "x") != nullptr);
    CHECK(!r.hasPending("shares.tranche_size"));

    CHECK(r.getInt("shares.tranche_size", 0) == 1000);
    CHECK(r.getString("output.label", "") == "hello world");

    std::remove(path.c_str());
  }

  // ---- Comments are stripped outside quotes only ----
  {
    const std::string path = "shipcalc_test_cvars_comments.cfg";
    writeFile(path,
              "# leading comment\n"
              "k.hash = \"abc # def\" # trailing\n"
              "k.url = \"http://example.com/a\" // trailing\n"
              "k.num = 2.5   # trailing\n"
              "\n");

    CVarRegistry r;
    CHECK(r.defineString("k.hash", "") != nullptr);
    CHECK(r.defineString("k.url", "") != nullptr);
    CHECK(r.defineFloat("k.num", 0.0) != nullptr);

    std::string err;
    CHECK(r.loadFile(path, &err));
    CHECK(r.getString("k.hash", "") == "abc # def");
    CHECK(r.getString("k.url", "") == "http://example.com/a");
    CHECK_NEAR(r.getFloat("k.num", 0.0), 2.5, 1e-12);

    std::remove(path.c_str());
  }

  // ---- Bad lines are reported with file:line ----
  {
    const std::string path = "shipcalc_test_cvars_bad.cfg";
    writeFile(path, "output.json = maybe\n");

    CVarRegistry r;
    CHECK(r.defineBool("output.json", false) != nullptr);
    std::string err;
    CHECK(!r.loadFile(path, &err));
    CHECK(err.find(path + ":1:") != std::string::npos);
    CHECK(r.getBool("output.json", true) == false);

    std::remove(path.c_str());
    CHECK(!r.loadFile("shipcalc_no_such_file.cfg", &err));
  }

  // ---- Save + reload round-trip (archived only) ----
  {
    const std::string path = "shipcalc_test_cvars_roundtrip.cfg";

    CVarRegistry a;
    CHECK(a.defineBool("rt.b", true) != nullptr);
    CHECK(a.defineFloat("rt.f", 1.0) != nullptr);
    CHECK(a.defineString("rt.s", "with spaces") != nullptr);
    CHECK(a.defineInt("rt.volatile", 1, core::CVar_None) != nullptr);

    std::string err;
    CHECK(a.setFromString("rt.b", "0", &err));
    CHECK(a.setFromString("rt.f", "6250000", &err));
    CHECK(a.setFromString("rt.volatile", "9", &err));
    CHECK(a.saveFile(path, &err));

    CVarRegistry b;
    CHECK(b.loadFile(path, &err));
    CHECK(!b.hasPending("rt.volatile"));
    CHECK(b.defineBool("rt.b", true) != nullptr);
    CHECK(b.defineFloat("rt.f", 0.0) != nullptr);
    CHECK(b.defineString("rt.s", "") != nullptr);

    CHECK(b.getBool("rt.b", true) == false);
    CHECK_NEAR(b.getFloat("rt.f", 0.0), 6250000.0, 1e-6);
    CHECK(b.getString("rt.s", "") == "with spaces");

    std::remove(path.c_str());
  }

  // ---- Defaults and their listeners ----
  {
    CVarRegistry r;
    core::installDefaultCVars(r);
    core::installDefaultCVars(r);

    CHECK(r.getString("log.level", "") == "info");
    CHECK(r.getBool("log.timestamps", false) == true);
    CHECK(r.getBool("output.json", true) == false);
    CHECK(r.getBool("output.pretty", false) == true);
    CHECK_NEAR(r.getFloat("route.fuel_factor", 0.0), 1.0, 1e-12);
    CHECK_NEAR(r.getFloat("shares.base_price", 0.0), 6250000.0, 1e-6);
    CHECK(r.getInt("shares.tranche_size", 0) == 25000);
    CHECK(r.list("shares").size() == 2);
    CHECK(r.list().size() == 7);

    const core::LogLevel prevLevel = core::getLogLevel();
    const bool prevTs = core::getLogTimestamps();

    CHECK(r.setFromString("log.level", "debug"));
    CHECK(core::getLogLevel() == core::LogLevel::Debug);
    CHECK(r.setFromString("log.timestamps", "false"));
    CHECK(core::getLogTimestamps() == false);

    core::setLogLevel(prevLevel);
    core::setLogTimestamps(prevTs);
  }

  CHECK(std::string(CVarRegistry::typeName(CVarType::Float)) == "float");

  return failures;
}
