#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shipcalc::core {

// Small argument parser for the shipcalc command line.
//
// Supports:
//  - Subcommand:    the first bare word (e.g. "vessel", "route")
//  - Flags:         --flag   -h
//  - KV args:       --key value   --key=value
//  - Positional:    everything else
//
// A token that looks like a number (-1, -0.5, 1e-3) is always a value, never a switch.
// Repeated keys are preserved; last() returns the final occurrence.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  // Keys listed here never consume a value: "--json route" keeps "route" positional.
  void setFlagOnly(std::string_view key) { flagOnly_.emplace_back(key); }

  void parse(int argc, char** argv);

  const std::string& program() const { return program_; }

  // First positional token, or empty when none was given.
  const std::string& command() const { return command_; }

  bool hasFlag(std::string_view key) const;
  bool has(std::string_view key) const;

  std::optional<std::string> last(std::string_view key) const;
  std::vector<std::string> values(std::string_view key) const;

  const std::vector<std::string>& flags() const { return flags_; }
  const std::vector<std::string>& positional() const { return positional_; }

  // Typed helpers (return true if provided & fully parsed).
  bool getInt(std::string_view key, long long& out) const;
  bool getDouble(std::string_view key, double& out) const;
  bool getString(std::string_view key, std::string& out) const;

  // Keys that were given but are not in `known`. Useful for "unknown option" errors.
  std::vector<std::string> unknownKeys(const std::vector<std::string_view>& known) const;

  static bool looksLikeNumber(std::string_view s);

private:
  bool isFlagOnly(std::string_view key) const;
  static bool isSwitch(std::string_view s);

  std::string program_;
  std::string command_;
  std::vector<std::string> flagOnly_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace shipcalc::core
