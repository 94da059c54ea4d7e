#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <istream>
#include <ostream>

namespace irmcp::mcp {

// handle_request_guarded turns one decoded document into exactly one response.
// Any exception escaping the dispatcher is converted to kInternalError carrying the
// request id, so a failing capability never takes the loop down.
JsonRpcResponse handle_request_guarded(const nlohmann::json& document, ServerContext& ctx);

// run_server_loop reads framed requests from in and writes framed responses to out until
// in is exhausted. Diagnostics go to stderr. Returns the process exit code.
int run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace irmcp::mcp
