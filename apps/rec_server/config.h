#pragma once

#include "../shared/arg_parser.h"
#include "../shared/engine_options.h"

namespace crec::rpc {

// ServerConfig holds all parsed startup flags for the recommendation server.
struct ServerConfig {
  apps::EngineOptions engine;  // NOLINT(readability-identifier-naming)
  // Load the data directory before serving instead of on the first data request.
  bool eager_load{false};  // NOLINT(readability-identifier-naming)
};

std::vector<apps::Option<ServerConfig>> build_option_registry();

apps::ParsedOptions<ServerConfig> parse_args(int argc,
                                             char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace crec::rpc
