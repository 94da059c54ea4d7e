#pragma once

#include "config.h"
#include <string>
#include <vector>

namespace irmcp::mcp {

// validate_mcp_server_config checks startup preconditions for the MCP server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - docs_dir and changelog_path are non-empty
// - docs_dir, if it exists, is a directory
// - changelog_path, if it exists, is not a directory
//
// Paths that do not exist are accepted: the affected tools answer "not found".
[[nodiscard]] std::string validate_mcp_server_config(const McpServerConfig& config);

// startup_warnings lists non-fatal problems worth surfacing in the startup banner.
[[nodiscard]] std::vector<std::string> startup_warnings(const McpServerConfig& config);

}  // namespace irmcp::mcp
