#include "rpc_protocol.h"

namespace crec::rpc {

using json = nlohmann::json;

core::Result<JsonRpcRequest, JsonRpcError> parse_request(const std::string& line) {
  using R = core::Result<JsonRpcRequest, JsonRpcError>;

  json doc = json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return R::err({kParseError, "Invalid JSON", json::object()});
  }
  if (!doc.is_object()) {
    return R::err({kInvalidRequest, "Request must be a JSON object", json::object()});
  }

  JsonRpcRequest request;
  if (auto it = doc.find("id"); it != doc.end() && (it->is_string() || it->is_number())) {
    request.id = *it;
  }

  auto method = doc.find("method");
  if (method == doc.end() || !method->is_string()) {
    return R::err({kInvalidRequest, "Request has no method", {{"id", request.id}}});
  }
  request.method = method->get<std::string>();

  if (auto it = doc.find("jsonrpc"); it != doc.end() && it->is_string()) {
    request.jsonrpc = it->get<std::string>();
  }
  if (auto it = doc.find("params"); it != doc.end() && !it->is_null()) {
    request.params = *it;
  } else {
    request.params = json::object();
  }

  return R::ok(std::move(request));
}

std::string make_response(const json& id, const json& result) {
  json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id;
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const json& id, const JsonRpcError& error) {
  json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id;
  response["error"] = {
      {"code", error.code},
      {"message", error.message},
      {"data", error.data},
  };
  return response.dump();
}

}  // namespace crec::rpc
