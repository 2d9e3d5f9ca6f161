#pragma once

#include "server_context.h"
#include <iostream>

namespace crec::rpc {

// run_server_loop reads one JSON-RPC request per line from in and writes one response
// per line to out until in is exhausted. Blank lines are ignored. Per-request
// diagnostics go to log.
void run_server_loop(ServerContext& ctx, std::istream& in = std::cin,
                     std::ostream& out = std::cout, std::ostream& log = std::cerr);

}  // namespace crec::rpc
