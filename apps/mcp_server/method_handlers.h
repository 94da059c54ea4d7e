#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace irmcp::mcp {

// Method enumerates every JSON-RPC method the server answers.
// Adding a method means extending parse_method, to_string and the switch in dispatch;
// the compiler flags any switch that misses an enumerator.
enum class Method : uint8_t {
  kInitialize,          // "initialize"
  kToolsList,           // "tools/list"
  kToolsCall,           // "tools/call"
  kResourcesList,       // "resources/list"
  kResourcesRead,       // "resources/read"
  kCompletionComplete,  // "completion/complete"
};

// parse_method returns std::nullopt for any unrecognised method name. Case-sensitive.
[[nodiscard]] std::optional<Method> parse_method(const std::string& name);

[[nodiscard]] std::string_view to_string(Method method);

// Argument name that triggers completion suggestions; every other argument gets none.
constexpr const char* kCompletionTriggerArgument = "method";

JsonRpcResponse handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);
JsonRpcResponse handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx);
JsonRpcResponse handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx);
JsonRpcResponse handle_resources_list(const JsonRpcRequest& req, ServerContext& ctx);
JsonRpcResponse handle_resources_read(const JsonRpcRequest& req, ServerContext& ctx);
JsonRpcResponse handle_completion(const JsonRpcRequest& req, ServerContext& ctx);

// dispatch routes req to its handler and always produces exactly one response.
// When ctx.config.log_requests is set, it logs "Received: <method>" to stderr first.
// Routing and validation failures become error responses here. Failures raised by a
// capability itself propagate to the caller (see handle_request_guarded).
JsonRpcResponse dispatch(const JsonRpcRequest& req, ServerContext& ctx);

}  // namespace irmcp::mcp
