#include "crec/app/engine_handle.h"
#include "crec/core/version.h"

#include "../shared/engine_options.h"
#include "../shared/load_report_printer.h"
#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <iostream>
#include <string>

using namespace crec;

int main(int argc, char* argv[]) {
  auto parsed = rpc::parse_args(argc, argv);
  if (!parsed.ok) {
    std::cerr << "Options:\n";
    apps::print_options(std::cerr, rpc::build_option_registry());
    return 1;
  }
  const rpc::ServerConfig& config = parsed.config;

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = rpc::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // The guard has already confirmed a data directory resolves.
  const std::string data_dir = apps::resolve_data_dir(config.engine).value();

  std::cerr << "content-recommender server v" << core::kBuildVersion << "\n"
            << "Recency cap: " << config.engine.recommender.recency_cap << "\n"
            << "Breadth:     " << config.engine.recommender.candidate_breadth << "\n"
            << "Loading:     " << (config.eager_load ? "eager" : "lazy (first data request)")
            << "\n";

  app::EngineHandle engine(apps::to_load_options(config.engine, data_dir),
                           config.engine.recommender);

  if (config.eager_load) {
    auto loaded = engine.get();
    if (!loaded.has_value()) {
      std::cerr << "Error: " << loaded.error() << "\n";
      return 1;
    }
    apps::print_load_report(std::cerr, data_dir, loaded.value()->load_report());
  } else {
    std::cerr << "Data:        " << data_dir << "\n";
  }

  std::cerr << "Serving JSON-RPC on stdio\n";

  rpc::ServerContext ctx{engine};
  rpc::run_server_loop(ctx);
  return 0;
}
