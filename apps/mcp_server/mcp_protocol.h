#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace irmcp::mcp {

// JSON-RPC 2.0 message types
struct JsonRpcRequest {
  nlohmann::json id;      // NOLINT(readability-identifier-naming) null when absent
  std::string method;     // NOLINT(readability-identifier-naming)
  nlohmann::json params;  // NOLINT(readability-identifier-naming) always an object or absent-as-{}
};

struct JsonRpcError {
  int code;             // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
};

// A response carries exactly one of a result document or an error.
struct JsonRpcResponse {
  nlohmann::json id;                                   // NOLINT(readability-identifier-naming)
  std::variant<nlohmann::json, JsonRpcError> payload;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_error() const { return std::holds_alternative<JsonRpcError>(payload); }
};

// JSON-RPC 2.0 error codes
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Outcome of interpreting a decoded document as a request.
// On failure, error_response is the envelope to send back (id echoed when recoverable).
struct ParsedRequest {
  std::optional<JsonRpcRequest> request;          // NOLINT(readability-identifier-naming)
  std::optional<JsonRpcResponse> error_response;  // NOLINT(readability-identifier-naming)
};

// Interpret a decoded JSON document as a request.
// Non-object documents and documents without a string "method" are invalid requests.
ParsedRequest parse_request(const nlohmann::json& document);

// Create JSON-RPC success response
JsonRpcResponse make_response(const nlohmann::json& id, nlohmann::json result);

// Create JSON-RPC error response
JsonRpcResponse make_error_response(const nlohmann::json& id, int code, std::string message);

// Wire form: {"jsonrpc":"2.0","id":...,"result"|"error":...}
nlohmann::json to_json(const JsonRpcResponse& response);

}  // namespace irmcp::mcp
