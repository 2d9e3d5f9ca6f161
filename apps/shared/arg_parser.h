#pragma once

#include "crec/core/normalization.h"

#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace crec::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedOptions carries the populated config plus whether every flag was accepted.
template <typename Config>
struct ParsedOptions {
  Config config;    // NOLINT(readability-identifier-naming)
  bool ok{true};    // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Unknown flags, missing values and rejected values are reported to stderr and clear
// ParsedOptions::ok; parsing still continues so every problem is reported at once.
// Non-flag tokens are skipped (callers handle positional arguments separately).
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          if (!opt->handler(parsed.config,
                            argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            parsed.ok = false;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          parsed.ok = false;
        }
      } else if (!opt->handler(parsed.config, "")) {
        parsed.ok = false;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    }
  }

  return parsed;
}

// print_options writes one "  --flag <value>  description" line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

// parse_count parses a non-negative integer flag value, reporting failures to stderr.
inline std::optional<std::size_t> parse_count(const std::string& flag, const std::string& value) {
  const auto n = core::parse_int64(value);
  if (!n.has_value() || n.value() < 0) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected a non-negative integer)\n";
    return std::nullopt;
  }
  return static_cast<std::size_t>(n.value());
}

}  // namespace crec::apps
