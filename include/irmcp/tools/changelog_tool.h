#pragma once

#include "irmcp/capability/tool.h"

#include <filesystem>
#include <string>

namespace irmcp::tools {

/// Answers questions about releases from a Keep-a-Changelog style markdown file.
///
/// Version headers are lines of the form "# 1.2.3", "## [1.2.3]" or "## v1.2.3 - date".
/// The file is re-read on every call.
class ChangelogTool : public capability::ITool {
 public:
  explicit ChangelogTool(std::filesystem::path changelog_path);

  [[nodiscard]] std::string description() const override;
  [[nodiscard]] nlohmann::json input_schema() const override;
  [[nodiscard]] std::string call(const nlohmann::json& arguments) const override;

 private:
  std::filesystem::path changelog_path_;
};

// The three query modes, exposed for direct testing against in-memory text.
[[nodiscard]] std::string changelog_version_info(const std::string& content,
                                                 const std::string& version);
[[nodiscard]] std::string changelog_latest_changes(const std::string& content);
[[nodiscard]] std::string changelog_search(const std::string& content, const std::string& search);

}  // namespace irmcp::tools
