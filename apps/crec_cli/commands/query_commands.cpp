#include "query_commands.h"

#include "crec/app/app_service.h"
#include "crec/app/recommender_instance.h"
#include "crec/core/ids.h"
#include "crec/core/normalization.h"
#include "crec/domain/recommendation.h"

#include <nlohmann/json.hpp>

#include "../../shared/arg_parser.h"
#include "../../shared/engine_options.h"
#include "../../shared/load_report_printer.h"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct QueryCliConfig {
  crec::apps::EngineOptions engine;
  std::optional<std::int64_t> user_id;
  std::optional<std::int64_t> item_id;
  int top_n{5};
  std::size_t k{10};
  std::size_t limit{100};
};

using QueryOption = crec::apps::Option<QueryCliConfig>;

std::optional<std::int64_t> parse_id(const std::string& flag, const std::string& value) {
  auto id = crec::core::parse_int64(value);
  if (!id.has_value()) {
    std::cerr << "Invalid " << flag << ": " << value << " (expected an integer)\n";
  }
  return id;
}

QueryOption user_option() {
  return {"--user", true, "User identifier", [](QueryCliConfig& c, const std::string& v) {
            c.user_id = parse_id("--user", v);
            return c.user_id.has_value();
          }};
}

QueryOption item_option() {
  return {"--item", true, "Item identifier", [](QueryCliConfig& c, const std::string& v) {
            c.item_id = parse_id("--item", v);
            return c.item_id.has_value();
          }};
}

QueryOption top_option() {
  return {"--top", true, "Number of recommendations (default: 5)",
          [](QueryCliConfig& c, const std::string& v) {
            auto n = parse_id("--top", v);
            if (n.has_value()) {
              c.top_n = static_cast<int>(std::clamp<std::int64_t>(
                  n.value(), 0, std::numeric_limits<int>::max()));
            }
            return n.has_value();
          }};
}

QueryOption k_option() {
  return {"--k", true, "Number of similar items (default: 10)",
          [](QueryCliConfig& c, const std::string& v) {
            auto n = crec::apps::parse_count("--k", v);
            if (n.has_value()) {
              c.k = n.value();
            }
            return n.has_value();
          }};
}

QueryOption limit_option() {
  return {"--limit", true, "Maximum users listed (default: 100)",
          [](QueryCliConfig& c, const std::string& v) {
            auto n = crec::apps::parse_count("--limit", v);
            if (n.has_value()) {
              c.limit = n.value();
            }
            return n.has_value();
          }};
}

// Parses subcommand flags (argv[2..]) on top of the shared engine flags.
std::optional<QueryCliConfig> parse_query_flags(int argc, char* argv[],  // NOLINT
                                                std::vector<QueryOption> extra) {
  auto options = crec::apps::engine_option_registry<QueryCliConfig>();
  options.insert(options.end(), extra.begin(), extra.end());

  auto parsed = crec::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    std::cerr << "Options:\n";
    crec::apps::print_options(std::cerr, options);
    return std::nullopt;
  }
  return parsed.config;
}

// Loads the engine and reports its diagnostics to stderr. nullptr on failure.
std::shared_ptr<const crec::app::RecommenderInstance> load_engine(
    const crec::apps::EngineOptions& options) {
  const auto data_dir = crec::apps::resolve_data_dir(options);
  if (!data_dir.has_value()) {
    std::cerr << "Error: no data directory found (looked for ./data and ../data). "
                 "Pass --data <dir>.\n";
    return nullptr;
  }

  auto result = crec::app::load_recommender(crec::apps::to_load_options(options, *data_dir),
                                            options.recommender);
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return nullptr;
  }

  const auto& instance = result.value();
  crec::apps::print_load_report(std::cerr, *data_dir, instance->load_report());
  return instance;
}

}  // namespace

int cmd_recommend(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto config = parse_query_flags(argc, argv, {user_option(), top_option()});
  if (!config.has_value()) {
    return 1;
  }
  if (!config->user_id.has_value()) {
    std::cerr << "Usage: crec_cli recommend --user <id> [--top <n>] [--data <dir>]\n";
    return 1;
  }

  auto instance = load_engine(config->engine);
  if (!instance) {
    return 1;
  }

  crec::app::RecommendRequest req{crec::core::UserId{*config->user_id}, config->top_n};
  const auto list = crec::app::run_recommend(req, *instance);

  auto out = crec::domain::recommendation_list_to_json(list);
  out["source"] = crec::domain::to_string(list.source);
  std::cout << out.dump(2) << "\n";
  return 0;
}

int cmd_similar(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto config = parse_query_flags(argc, argv, {item_option(), k_option()});
  if (!config.has_value()) {
    return 1;
  }
  if (!config->item_id.has_value()) {
    std::cerr << "Usage: crec_cli similar --item <id> [--k <n>] [--data <dir>]\n";
    return 1;
  }

  auto instance = load_engine(config->engine);
  if (!instance) {
    return 1;
  }

  const auto response = crec::app::run_similar(
      crec::app::SimilarRequest{crec::core::ItemId{*config->item_id}, config->k}, *instance);
  if (!response.known_item) {
    std::cerr << "WARNING: item " << *config->item_id << " has no embedding\n";
  }
  std::cout << crec::app::similar_response_to_json(response).dump(2) << "\n";
  return 0;
}

int cmd_history(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto config = parse_query_flags(argc, argv, {user_option()});
  if (!config.has_value()) {
    return 1;
  }
  if (!config->user_id.has_value()) {
    std::cerr << "Usage: crec_cli history --user <id> [--data <dir>]\n";
    return 1;
  }

  auto instance = load_engine(config->engine);
  if (!instance) {
    return 1;
  }

  const auto response =
      crec::app::fetch_history(crec::core::UserId{*config->user_id}, *instance);
  std::cout << crec::app::history_response_to_json(response).dump(2) << "\n";
  return 0;
}

int cmd_users(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto config = parse_query_flags(argc, argv, {limit_option()});
  if (!config.has_value()) {
    return 1;
  }

  auto instance = load_engine(config->engine);
  if (!instance) {
    return 1;
  }

  const auto response = crec::app::list_users(config->limit, *instance);
  if (response.placeholder) {
    std::cerr << "WARNING: interaction log is empty; user ids below are placeholders\n";
  }
  std::cout << crec::app::users_response_to_json(response).dump(2) << "\n";
  return 0;
}

int cmd_stats(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto config = parse_query_flags(argc, argv, {});
  if (!config.has_value()) {
    return 1;
  }

  auto instance = load_engine(config->engine);
  if (!instance) {
    return 1;
  }

  std::cout << crec::app::stats_to_json(*instance).dump(2) << "\n";
  return 0;
}

int cmd_health(int /*argc*/, char* /*argv*/[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::cout << crec::app::health_json().dump(2) << "\n";
  return 0;
}
