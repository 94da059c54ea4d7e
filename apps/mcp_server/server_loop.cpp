#include "server_loop.h"

#include "framing.h"
#include "method_handlers.h"
#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace irmcp::mcp {

using json = nlohmann::json;

JsonRpcResponse handle_request_guarded(const json& document, ServerContext& ctx) {
  auto parsed = parse_request(document);
  if (!parsed.request.has_value()) {
    std::cerr << "Rejected invalid request\n";
    return std::move(parsed.error_response).value();
  }

  const JsonRpcRequest& request = parsed.request.value();

  try {
    return dispatch(request, ctx);
  } catch (const std::exception& e) {
    std::cerr << "Internal error handling " << request.method << ": " << e.what() << "\n";
    return make_error_response(request.id, kInternalError,
                               std::string("Internal error: ") + e.what());
  } catch (...) {
    std::cerr << "Internal error handling " << request.method << ": non-standard exception\n";
    return make_error_response(request.id, kInternalError,
                               "Internal error: non-standard exception");
  }
}

int run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  // Main loop: one framed request in, one framed response out, strictly in turn.
  while (true) {
    auto frame = read_frame(in);

    switch (frame.status) {
      case ReadStatus::kEndOfStream:
        std::cerr << "MCP Server shutting down\n";
        return 0;
      case ReadStatus::kSkipped:
        std::cerr << frame.diagnostic << "\n";
        continue;
      case ReadStatus::kMessage:
        break;
    }

    write_frame(out, to_json(handle_request_guarded(frame.document, ctx)));
  }
}

}  // namespace irmcp::mcp
