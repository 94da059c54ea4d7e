#pragma once

#include "irmcp/capability/capability_registry.h"

#include "config.h"

namespace irmcp::mcp {

// ServerContext holds all process-lifetime references passed to every method handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  const capability::CapabilityRegistry& registry;  // NOLINT(readability-identifier-naming)
  const McpServerConfig& config;                   // NOLINT(readability-identifier-naming)
};

}  // namespace irmcp::mcp
