#include "config.h"

namespace crec::rpc {

std::vector<apps::Option<ServerConfig>> build_option_registry() {
  auto options = apps::engine_option_registry<ServerConfig>();
  options.push_back({"--eager", false, "Load the data directory at startup",
                     [](ServerConfig& c, const std::string& /*value*/) {
                       c.eager_load = true;
                       return true;
                     }});
  return options;
}

apps::ParsedOptions<ServerConfig> parse_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, build_option_registry());
}

}  // namespace crec::rpc
