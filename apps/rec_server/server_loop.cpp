#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "method_handlers.h"
#include "rpc_protocol.h"
#include <exception>
#include <string>

namespace crec::rpc {

using json = nlohmann::json;

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out, std::ostream& log) {
  const auto method_registry = build_method_registry();

  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }

    auto parsed = parse_request(line);
    if (!parsed.has_value()) {
      const auto& error = parsed.error();
      const json id = error.data.contains("id") ? error.data["id"] : json(nullptr);
      out << make_error_response(id, error) << "\n" << std::flush;
      continue;
    }

    const auto& request = parsed.value();
    log << "Received: " << request.method << "\n";

    auto it = method_registry.find(request.method);
    if (it == method_registry.end()) {
      out << make_error_response(request.id, {kMethodNotFound,
                                              "Unknown method: " + request.method,
                                              json::object()})
          << "\n"
          << std::flush;
      continue;
    }

    MethodResult outcome;
    try {
      outcome = it->second(request, ctx);
    } catch (const std::exception& e) {
      log << "ERROR: " << request.method << " failed: " << e.what() << "\n";
      outcome = MethodResult::fail(kInternalError, "Internal error", {{"detail", e.what()}});
    }

    if (outcome.error.has_value()) {
      out << make_error_response(request.id, *outcome.error) << "\n" << std::flush;
    } else {
      out << make_response(request.id, outcome.result) << "\n" << std::flush;
    }
  }

  log << "Recommendation server shutting down\n";
}

}  // namespace crec::rpc
