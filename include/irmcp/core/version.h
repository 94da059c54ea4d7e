#pragma once

namespace irmcp::core {

// kServerName is the identity advertised in the initialize handshake.
constexpr const char* kServerName = "inertia-rails-mcp";

// kBuildVersion is the current software version string.
// Updated once per release.
constexpr const char* kBuildVersion = "1.0.0";

// kProtocolVersion is the MCP protocol revision this server speaks.
constexpr const char* kProtocolVersion = "2024-11-05";

}  // namespace irmcp::core
