#include "mcp_protocol.h"

#include <utility>

namespace irmcp::mcp {

using json = nlohmann::json;

namespace {

// Only strings and numbers are valid correlation ids; anything else is dropped to null.
json extract_id(const json& document) {
  auto it = document.find("id");
  if (it == document.end()) {
    return nullptr;
  }
  if (it->is_string() || it->is_number()) {
    return *it;
  }
  return nullptr;
}

}  // namespace

ParsedRequest parse_request(const json& document) {
  if (!document.is_object()) {
    return {std::nullopt,
            make_error_response(nullptr, kInvalidRequest, "Invalid Request: expected an object")};
  }

  JsonRpcRequest request;
  request.id = extract_id(document);

  auto method_it = document.find("method");
  if (method_it == document.end() || !method_it->is_string()) {
    return {std::nullopt, make_error_response(request.id, kInvalidRequest,
                                              "Invalid Request: missing method")};
  }
  request.method = method_it->get<std::string>();

  auto params_it = document.find("params");
  if (params_it == document.end() || params_it->is_null()) {
    request.params = json::object();
  } else if (params_it->is_object()) {
    request.params = *params_it;
  } else {
    return {std::nullopt, make_error_response(request.id, kInvalidRequest,
                                              "Invalid Request: params must be an object")};
  }

  return {std::move(request), std::nullopt};
}

JsonRpcResponse make_response(const json& id, json result) {
  JsonRpcResponse response;
  response.id = id;
  response.payload.emplace<json>(std::move(result));
  return response;
}

JsonRpcResponse make_error_response(const json& id, int code, std::string message) {
  JsonRpcResponse response;
  response.id = id;
  response.payload.emplace<JsonRpcError>(JsonRpcError{code, std::move(message)});
  return response;
}

json to_json(const JsonRpcResponse& response) {
  json wire;
  wire["jsonrpc"] = "2.0";
  wire["id"] = response.id;
  if (const auto* error = std::get_if<JsonRpcError>(&response.payload)) {
    wire["error"] = {
        {"code", error->code},
        {"message", error->message},
    };
  } else {
    wire["result"] = std::get<json>(response.payload);
  }
  return wire;
}

}  // namespace irmcp::mcp
