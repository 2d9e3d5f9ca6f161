#pragma once

#include "config.h"
#include <string>

namespace crec::rpc {

// validate_server_config checks startup preconditions for the server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - a data directory is configured or found by probing, and it exists
// - recency_cap and candidate_breadth are at least 1
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

}  // namespace crec::rpc
