#pragma once

#include "crec/ingest/data_loader.h"
#include "crec/recommend/recommendation_engine.h"

#include "arg_parser.h"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace crec::apps {

// EngineOptions are the flags every app shares for locating and tuning the engine.
struct EngineOptions {
  std::optional<std::string> data_dir;        // NOLINT(readability-identifier-naming)
  recommend::RecommenderConfig recommender;   // NOLINT(readability-identifier-naming)
  std::size_t max_click_files{10};            // NOLINT(readability-identifier-naming)
};

// engine_option_registry returns the shared flags for any Config with an
// `EngineOptions engine` member.
template <typename Config>
std::vector<Option<Config>> engine_option_registry() {
  return {
      {"--data", true, "Data directory (default: ./data, then ../data)",
       [](Config& c, const std::string& v) {
         c.engine.data_dir = v;
         return true;
       }},
      {"--recency-cap", true, "History items used as similarity seeds (default: 5)",
       [](Config& c, const std::string& v) {
         auto n = parse_count("--recency-cap", v);
         if (n.has_value()) {
           c.engine.recommender.recency_cap = n.value();
         }
         return n.has_value();
       }},
      {"--candidate-breadth", true, "Neighbours fetched per seed item (default: 20)",
       [](Config& c, const std::string& v) {
         auto n = parse_count("--candidate-breadth", v);
         if (n.has_value()) {
           c.engine.recommender.candidate_breadth = n.value();
         }
         return n.has_value();
       }},
      {"--max-click-files", true, "Interaction-log files to read (default: 10)",
       [](Config& c, const std::string& v) {
         auto n = parse_count("--max-click-files", v);
         if (n.has_value()) {
           c.engine.max_click_files = n.value();
         }
         return n.has_value();
       }},
  };
}

// resolve_data_dir returns the explicit --data value, or the first of ./data and
// ../data that exists. nullopt means no candidate was found.
inline std::optional<std::string> resolve_data_dir(const EngineOptions& options) {
  if (options.data_dir.has_value()) {
    return options.data_dir;
  }
  std::error_code ec;
  for (const char* candidate : {"data", "../data"}) {
    if (std::filesystem::is_directory(candidate, ec)) {
      return std::string(candidate);
    }
  }
  return std::nullopt;
}

inline ingest::LoadOptions to_load_options(const EngineOptions& options,
                                           const std::string& data_dir) {
  return ingest::LoadOptions{data_dir, options.max_click_files};
}

}  // namespace crec::apps
