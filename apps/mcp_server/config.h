#pragma once

#include "irmcp/corpus/text_corpus.h"

#include "../shared/arg_parser.h"
#include <ostream>
#include <string>
#include <string_view>

namespace irmcp::mcp {

// McpServerConfig holds all parsed startup flags for the MCP server.
// Every field has an explicit default so the server runs with no flags at all.
struct McpServerConfig {
  std::string docs_dir{"docs"};                // NOLINT(readability-identifier-naming)
  std::string changelog_path{"CHANGELOG.md"};  // NOLINT(readability-identifier-naming)
  // Log one "Received: <method>" line to stderr per request.
  bool log_requests{true};  // NOLINT(readability-identifier-naming)
};

using ParsedArgs = apps::ParseOutcome<McpServerConfig>;

// parse_args applies every flag to a default McpServerConfig. Empty path values are
// rejected here; ParsedArgs::errors is non-empty when the server must not start.
ParsedArgs parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// print_usage lists every flag with its description.
void print_usage(std::ostream& out, std::string_view program);

// corpus_paths maps the configured locations onto the capability layer's view.
[[nodiscard]] corpus::CorpusPaths corpus_paths(const McpServerConfig& config);

}  // namespace irmcp::mcp
