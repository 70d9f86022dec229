#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>

namespace shipcalc::core {

// Streaming JSON writer.
//
// The writer tracks nesting and inserts commas; callers only emit keys and values:
//
//   JsonWriter w(std::cout, true);
//   w.beginObject();
//   w.key("capacity"); w.value(2000);
//   w.key("bulbous");  w.value(false);
//   w.endObject();
//
// Non-finite doubles are written as null (JSON has no NaN/Inf).
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = false);

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  void key(std::string_view k);

  void value(std::string_view s);
  void value(const char* s);
  void value(bool b);
  void value(int v);
  void value(long long v);
  void value(unsigned long long v);
  void value(double v);
  void nullValue();

  // Nesting depth; 0 once the top-level value is closed.
  std::size_t depth() const { return stack_.size(); }

private:
  struct Frame {
    bool isObject{false};
    bool first{true};
  };

  void beforeValue();
  void newline();
  void writeEscaped(std::string_view s);

  std::ostream& out_;
  bool pretty_{false};
  bool afterKey_{false};
  std::vector<Frame> stack_;
};

} // namespace shipcalc::core
