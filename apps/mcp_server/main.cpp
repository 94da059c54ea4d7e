#include "irmcp/app/capability_catalog.h"
#include "irmcp/core/version.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <exception>
#include <iostream>
#include <string>

using namespace irmcp;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const std::string program = argc > 0 ? argv[0] : "inertia_rails_mcp";
  auto parsed = mcp::parse_args(argc, argv);
  for (const auto& warning : parsed.warnings) {
    std::cerr << warning << "\n";
  }
  if (parsed.help_requested) {
    mcp::print_usage(std::cerr, program);
    return 0;
  }
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << "Error: " << error << "\n";
    }
    mcp::print_usage(std::cerr, program);
    return 1;
  }
  const auto& config = parsed.config;

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = mcp::validate_mcp_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  // stdout carries protocol frames only; everything human-readable goes to stderr.
  std::cerr << core::kServerName << " MCP Server v" << core::kBuildVersion << " (protocol "
            << core::kProtocolVersion << ")\n";
  std::cerr << "Docs:        " << config.docs_dir << "\n";
  std::cerr << "Changelog:   " << config.changelog_path << "\n";
  for (const auto& warning : mcp::startup_warnings(config)) {
    std::cerr << warning << "\n";
  }
  std::cerr << "Listening on stdio for framed JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  try {
    const auto registry = app::build_capability_registry(mcp::corpus_paths(config));
    mcp::ServerContext ctx{registry, config};
    return mcp::run_server_loop(ctx, std::cin, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "Failed to start server: " << e.what() << "\n";
    return 1;
  }
}
