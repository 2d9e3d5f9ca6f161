#pragma once

#include "crec/core/result.h"

#include <nlohmann/json.hpp>

#include <string>

namespace crec::rpc {

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};  // NOLINT(readability-identifier-naming)
  nlohmann::json id;           // null when the request carried no id
  std::string method;          // NOLINT(readability-identifier-naming)
  nlohmann::json params;       // NOLINT(readability-identifier-naming)
};

struct JsonRpcError {
  int code;             // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
  nlohmann::json data;  // NOLINT(readability-identifier-naming)
};

// Error codes (JSON-RPC 2.0)
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// parse_request decodes one line. Malformed JSON yields kParseError; a document that
// is not a request object (or has no string method) yields kInvalidRequest.
// An absent params member becomes an empty object.
[[nodiscard]] core::Result<JsonRpcRequest, JsonRpcError> parse_request(const std::string& line);

// The id is echoed back verbatim, so numeric and string ids keep their type.
std::string make_response(const nlohmann::json& id, const nlohmann::json& result);

std::string make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace crec::rpc
