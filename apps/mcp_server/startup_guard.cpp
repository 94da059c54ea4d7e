#include "startup_guard.h"

#include <filesystem>
#include <system_error>

namespace irmcp::mcp {

std::string validate_mcp_server_config(const McpServerConfig& config) {
  if (config.docs_dir.empty()) {
    return "Error: --docs-dir must not be empty.";
  }
  if (config.changelog_path.empty()) {
    return "Error: --changelog must not be empty.";
  }

  std::error_code ec;
  if (std::filesystem::exists(config.docs_dir, ec) &&
      !std::filesystem::is_directory(config.docs_dir, ec)) {
    return "Error: --docs-dir '" + config.docs_dir +
           "' is not a directory.\n"
           "       Point it at the root containing guide/, cookbook/ and api/.";
  }

  if (std::filesystem::is_directory(config.changelog_path, ec)) {
    return "Error: --changelog '" + config.changelog_path + "' is a directory, expected a file.";
  }

  return "";
}

std::vector<std::string> startup_warnings(const McpServerConfig& config) {
  std::vector<std::string> warnings;
  std::error_code ec;

  if (!std::filesystem::is_directory(config.docs_dir, ec)) {
    warnings.push_back("WARNING: Documentation directory '" + config.docs_dir +
                       "' not found. The documentation tool will return no results.");
  }
  if (!std::filesystem::is_regular_file(config.changelog_path, ec)) {
    warnings.push_back("WARNING: Changelog '" + config.changelog_path +
                       "' not found. The changelog tool will report it missing.");
  }

  return warnings;
}

}  // namespace irmcp::mcp
