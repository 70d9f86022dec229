#include "shipcalc/core/JsonWriter.h"

#include "test_harness.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

using namespace shipcalc;

int test_json_writer() {
  int failures = 0;

  // Compact nesting with comma placement.
  {
    std::ostringstream oss;
    core::JsonWriter w(oss);
    w.beginObject();
    w.key("name"); w.value("Ever Given");
    w.key("capacity"); w.value(20000);
    w.key("bulbous"); w.value(true);
    w.key("antifouling_model"); w.nullValue();
    w.key("tiers");
    w.beginArray();
    w.value(0LL);
    w.value(1LL);
    w.endArray();
    w.key("empty");
    w.beginObject();
    w.endObject();
    w.endObject();

    CHECK(w.depth() == 0);
    CHECK(oss.str() ==
          "{\"name\":\"Ever Given\",\"capacity\":20000,\"bulbous\":true,\"antifouling_model\":null,"
          "\"tiers\":[0,1],\"empty\":{}}");
  }

  // Numbers: integral doubles print plainly, fractions round-trip, non-finite is null.
  {
    std::ostringstream oss;
    core::JsonWriter w(oss);
    w.beginArray();
    w.value(17800000.0);
    w.value(0.1);
    w.value(-2.5);
    w.value(std::numeric_limits<double>::infinity());
    w.value(std::nan(""));
    w.value(18446744073709551615ull);
    w.endArray();
    CHECK(oss.str() == "[17800000,0.1,-2.5,null,null,18446744073709551615]");
  }

  // Escaping.
  {
    std::ostringstream oss;
    core::JsonWriter w(oss);
    w.value(std::string_view("a\"b\\c\n\x01"));
    CHECK(oss.str() == "\"a\\\"b\\\\c\\n\\u0001\"");
  }

  // A null C string is written as null.
  {
    std::ostringstream oss;
    core::JsonWriter w(oss);
    const char* missing = nullptr;
    w.value(missing);
    CHECK(oss.str() == "null");
  }

  // Pretty printing uses two-space indentation.
  {
    std::ostringstream oss;
    core::JsonWriter w(oss, true);
    w.beginObject();
    w.key("a"); w.value(1);
    w.key("b");
    w.beginArray();
    w.value(false);
    w.endArray();
    w.endObject();
    CHECK(oss.str() == "{\n  \"a\": 1,\n  \"b\": [\n    false\n  ]\n}");
  }

  return failures;
}
