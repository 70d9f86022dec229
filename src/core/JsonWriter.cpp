#include "shipcalc/core/JsonWriter.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace shipcalc::core {

JsonWriter::JsonWriter(std::ostream& out, bool pretty) : out_(out), pretty_(pretty) {}

void JsonWriter::newline() {
  if (!pretty_) return;
  out_ << '\n';
  for (std::size_t i = 0; i < stack_.size(); ++i) out_ << "  ";
}

void JsonWriter::beforeValue() {
  if (afterKey_) {
    afterKey_ = false;
    return;
  }
  if (stack_.empty()) return;

  Frame& f = stack_.back();
  if (!f.first) out_ << ',';
  f.first = false;
  newline();
}

void JsonWriter::beginObject() {
  beforeValue();
  out_ << '{';
  stack_.push_back(Frame{true, true});
}

void JsonWriter::endObject() {
  if (stack_.empty()) return;
  const bool empty = stack_.back().first;
  stack_.pop_back();
  if (!empty) newline();
  out_ << '}';
}

void JsonWriter::beginArray() {
  beforeValue();
  out_ << '[';
  stack_.push_back(Frame{false, true});
}

void JsonWriter::endArray() {
  if (stack_.empty()) return;
  const bool empty = stack_.back().first;
  stack_.pop_back();
  if (!empty) newline();
  out_ << ']';
}

void JsonWriter::key(std::string_view k) {
  beforeValue();
  writeEscaped(k);
  out_ << (pretty_ ? ": " : ":");
  afterKey_ = true;
}

void JsonWriter::writeEscaped(std::string_view s) {
  out_ << '"';
  for (const char c : s) {
    switch (c) {
      case '"':  out_ << "\\\""; break;
      case '\\': out_ << "\\\\"; break;
      case '\b': out_ << "\\b"; break;
      case '\f': out_ << "\\f"; break;
      case '\n': out_ << "\\n"; break;
      case '\r': out_ << "\\r"; break;
      case '\t': out_ << "\\t"; break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
          out_ << buf;
        } else {
          out_ << c;
        }
        break;
    }
  }
  out_ << '"';
}

void JsonWriter::value(std::string_view s) {
  beforeValue();
  writeEscaped(s);
}

void JsonWriter::value(const char* s) {
  if (!s) {
    nullValue();
    return;
  }
  value(std::string_view(s));
}

void JsonWriter::value(bool b) {
  beforeValue();
  out_ << (b ? "true" : "false");
}

void JsonWriter::value(int v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(unsigned long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(double v) {
  beforeValue();
  if (!std::isfinite(v)) {
    out_ << "null";
    return;
  }

  // Integral values print without a fraction or exponent.
  if (std::fabs(v) < 1e15 && std::floor(v) == v) {
    out_ << (long long)v;
    return;
  }

  // Otherwise the shortest round-trippable form.
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  for (int prec = 1; prec < 17; ++prec) {
    char tmp[32];
    std::snprintf(tmp, sizeof(tmp), "%.*g", prec, v);
    if (std::strtod(tmp, nullptr) == v) {
      out_ << tmp;
      return;
    }
  }
  out_ << buf;
}

void JsonWriter::nullValue() {
  beforeValue();
  out_ << "null";
}

} // namespace shipcalc::core
