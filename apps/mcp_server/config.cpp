#include "config.h"

#include <string>
#include <vector>

namespace irmcp::mcp {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_docs_dir(McpServerConfig& config, const std::string& value) {
  if (value.empty()) {
    return false;
  }
  config.docs_dir = value;
  return true;
}

bool handle_changelog(McpServerConfig& config, const std::string& value) {
  if (value.empty()) {
    return false;
  }
  config.changelog_path = value;
  return true;
}

bool handle_quiet(McpServerConfig& config, const std::string& /*value*/) {
  config.log_requests = false;
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<McpServerConfig>> build_option_registry() {
  return {
      {"--docs-dir", true, "Root of the markdown documentation tree (default: docs)",
       handle_docs_dir},
      {"--changelog", true, "Path to the changelog file (default: CHANGELOG.md)",
       handle_changelog},
      {"--quiet", false, "Do not log each received request to stderr", handle_quiet},
  };
}

}  // namespace

ParsedArgs parse_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, build_option_registry());
}

void print_usage(std::ostream& out, const std::string_view program) {
  apps::print_usage(out, program, build_option_registry());
}

corpus::CorpusPaths corpus_paths(const McpServerConfig& config) {
  return corpus::CorpusPaths{config.docs_dir, config.changelog_path};
}

}  // namespace irmcp::mcp
