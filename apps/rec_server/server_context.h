#pragma once

#include "crec/app/engine_handle.h"

namespace crec::rpc {

// ServerContext holds the process-lifetime state passed to every method handler.
// The handle must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  const app::EngineHandle& engine;  // NOLINT(readability-identifier-naming)
};

}  // namespace crec::rpc
