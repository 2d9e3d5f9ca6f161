#include "method_handlers.h"

#include "handlers/query_handlers.h"

namespace crec::rpc {

MethodRegistry build_method_registry() {
  return {
      {"health", handlers::handle_health},   {"recommend", handlers::handle_recommend},
      {"similar", handlers::handle_similar}, {"history", handlers::handle_history},
      {"users", handlers::handle_users},     {"stats", handlers::handle_stats},
  };
}

}  // namespace crec::rpc
