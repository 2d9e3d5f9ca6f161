#include "startup_guard.h"

#include <filesystem>
#include <system_error>

namespace crec::rpc {

std::string validate_server_config(const ServerConfig& config) {
  const auto data_dir = apps::resolve_data_dir(config.engine);
  if (!data_dir.has_value()) {
    return "Error: no data directory found (looked for ./data and ../data).\n"
           "       Pass --data <dir> pointing at the embeddings, metadata and clicks.";
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(data_dir.value(), ec)) {
    return "Error: --data '" + data_dir.value() + "' is not a directory.";
  }

  if (config.engine.recommender.recency_cap == 0) {
    return "Error: --recency-cap must be at least 1.";
  }
  if (config.engine.recommender.candidate_breadth == 0) {
    return "Error: --candidate-breadth must be at least 1.";
  }

  return "";
}

}  // namespace crec::rpc
