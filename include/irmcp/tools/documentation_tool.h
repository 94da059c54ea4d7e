#pragma once

#include "irmcp/capability/tool.h"

#include <filesystem>
#include <string>
#include <vector>

namespace irmcp::tools {

/// One matching passage inside a documentation file.
struct DocSection {
  std::string header;   // nearest preceding markdown heading, "Introduction" if none
  std::string content;  // matching line with up to two lines of context on each side
  std::size_t line{0};  // 1-based line number of the match
};

/// Case-insensitive full-text search over the markdown documentation tree.
///
/// Layout expected under docs_root: guide/, cookbook/ and api/ subdirectories, any depth.
/// A missing root simply yields no results.
class DocumentationTool : public capability::ITool {
 public:
  explicit DocumentationTool(std::filesystem::path docs_root);

  [[nodiscard]] std::string description() const override;
  [[nodiscard]] nlohmann::json input_schema() const override;
  [[nodiscard]] std::string call(const nlohmann::json& arguments) const override;

 private:
  std::filesystem::path docs_root_;
};

/// Extract at most max_sections passages of content whose lines contain query.
[[nodiscard]] std::vector<DocSection> extract_relevant_sections(const std::string& content,
                                                                const std::string& query,
                                                                std::size_t max_sections = 3);

}  // namespace irmcp::tools
