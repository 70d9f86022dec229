#include "shipcalc/core/Args.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace shipcalc::core {

static bool startsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool Args::looksLikeNumber(std::string_view s) {
  std::size_t i = 0;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
  if (i >= s.size()) return false;

  bool anyDigit = false;
  bool anyDot = false;

  for (; i < s.size(); ++i) {
    const unsigned char c = (unsigned char)s[i];
    if (std::isdigit(c)) {
      anyDigit = true;
      continue;
    }
    if (c == '.' && !anyDot) {
      anyDot = true;
      continue;
    }

    // Scientific notation.
    if ((c == 'e' || c == 'E') && anyDigit) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      bool expDigit = false;
      for (; i < s.size(); ++i) {
        if (!std::isdigit((unsigned char)s[i])) return false;
        expDigit = true;
      }
      return expDigit;
    }

    return false;
  }

  return anyDigit;
}

bool Args::isSwitch(std::string_view s) {
  if (s.size() < 2 || s[0] != '-') return false;
  return !looksLikeNumber(s);
}

bool Args::isFlagOnly(std::string_view key) const {
  return std::find(flagOnly_.begin(), flagOnly_.end(), key) != flagOnly_.end();
}

void Args::parse(int argc, char** argv) {
  program_.clear();
  command_.clear();
  kv_.clear();
  flags_.clear();
  positional_.clear();

  if (argc > 0 && argv && argv[0]) program_ = argv[0];

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i] ? std::string(argv[i]) : std::string();
    if (a.empty()) continue;

    // End-of-options marker: everything after this is positional.
    if (a == "--") {
      for (int j = i + 1; j < argc; ++j) {
        if (argv[j]) positional_.emplace_back(argv[j]);
      }
      break;
    }

    if (startsWith(a, "--")) {
      const auto eq = a.find('=');
      if (eq != std::string::npos) {
        kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
        continue;
      }

      const std::string key = a.substr(2);
      if (!isFlagOnly(key) && i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
        kv_[key].emplace_back(argv[++i]);
      } else {
        flags_.push_back(key);
      }
      continue;
    }

    if (isSwitch(a)) {
      // "-k=value" for single-letter options, otherwise grouped short flags (-hv).
      if (a.size() > 3 && a[2] == '=') {
        kv_[a.substr(1, 1)].push_back(a.substr(3));
        continue;
      }
      for (std::size_t j = 1; j < a.size(); ++j) {
        const char c = a[j];
        if (std::isalnum((unsigned char)c) || c == '_') flags_.emplace_back(1, c);
      }
      continue;
    }

    positional_.push_back(a);
  }

  if (!positional_.empty() && !looksLikeNumber(positional_.front())) {
    command_ = positional_.front();
  }
}

bool Args::hasFlag(std::string_view key) const {
  return std::find(flags_.begin(), flags_.end(), key) != flags_.end();
}

bool Args::has(std::string_view key) const {
  if (hasFlag(key)) return true;
  return kv_.find(std::string(key)) != kv_.end();
}

std::optional<std::string> Args::last(std::string_view key) const {
  const auto it = kv_.find(std::string(key));
  if (it == kv_.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

std::vector<std::string> Args::values(std::string_view key) const {
  const auto it = kv_.find(std::string(key));
  if (it == kv_.end()) return {};
  return it->second;
}

bool Args::getInt(std::string_view key, long long& out) const {
  const auto v = last(key);
  if (!v || v->empty()) return false;
  char* end = nullptr;
  const long long val = std::strtoll(v->c_str(), &end, 10);
  if (end != v->c_str() + v->size()) return false;
  out = val;
  return true;
}

bool Args::getDouble(std::string_view key, double& out) const {
  const auto v = last(key);
  if (!v || v->empty()) return false;
  char* end = nullptr;
  const double val = std::strtod(v->c_str(), &end);
  if (end != v->c_str() + v->size()) return false;
  out = val;
  return true;
}

bool Args::getString(std::string_view key, std::string& out) const {
  const auto v = last(key);
  if (!v) return false;
  out = *v;
  return true;
}

std::vector<std::string> Args::unknownKeys(const std::vector<std::string_view>& known) const {
  auto isKnown = [&](std::string_view k) {
    return std::find(known.begin(), known.end(), k) != known.end();
  };

  std::vector<std::string> out;
  for (const auto& kv : kv_) {
    if (!isKnown(kv.first)) out.push_back(kv.first);
  }
  for (const auto& f : flags_) {
    if (!isKnown(f) && std::find(out.begin(), out.end(), f) == out.end()) out.push_back(f);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace shipcalc::core
