#pragma once

#include <nlohmann/json.hpp>

#include "rpc_protocol.h"
#include "server_context.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace crec::rpc {

// MethodResult is either a result document or a JSON-RPC error, never both.
struct MethodResult {
  nlohmann::json result;              // NOLINT(readability-identifier-naming)
  std::optional<JsonRpcError> error;  // NOLINT(readability-identifier-naming)

  static MethodResult ok(nlohmann::json result) { return {std::move(result), std::nullopt}; }
  static MethodResult fail(int code, std::string message,
                           nlohmann::json data = nlohmann::json::object()) {
    return {nullptr, JsonRpcError{code, std::move(message), std::move(data)}};
  }
};

using MethodHandler = std::function<MethodResult(const JsonRpcRequest& req, ServerContext& ctx)>;
using MethodRegistry = std::unordered_map<std::string, MethodHandler>;

MethodRegistry build_method_registry();

}  // namespace crec::rpc
