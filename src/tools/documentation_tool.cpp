#include "irmcp/tools/documentation_tool.h"

#include "irmcp/core/normalization.h"
#include "irmcp/corpus/text_corpus.h"
#include "irmcp/tools/tool_arguments.h"

#include <algorithm>
#include <array>
#include <string_view>

namespace irmcp::tools {

using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 4> kCategories = {"guide", "cookbook", "api", "all"};

struct FileMatch {
  std::string file;
  std::vector<DocSection> sections;
};

// Returns the heading text if line is an ATX heading ("## Title"), empty otherwise.
std::string heading_text(const std::string& line) {
  std::size_t pos = 0;
  while (pos < line.size() && line[pos] == '#') {
    ++pos;
  }
  if (pos == 0 || pos >= line.size() || !core::is_ascii_space(line[pos])) {
    return {};
  }
  return core::trim(std::string_view(line).substr(pos));
}

std::string find_section_header(const std::vector<std::string>& lines, std::size_t index) {
  for (std::size_t i = index + 1; i-- > 0;) {
    std::string header = heading_text(lines[i]);
    if (!header.empty()) {
      return header;
    }
  }
  return "Introduction";
}

std::filesystem::path search_root(const std::filesystem::path& docs_root,
                                  const std::string& category) {
  if (category == "all") {
    return docs_root;
  }
  return docs_root / category;
}

std::string format_results(const std::vector<FileMatch>& results, const std::string& query) {
  std::vector<std::string> output;
  output.push_back("Documentation for '" + query + "':\n");

  for (const auto& result : results) {
    output.push_back("\n\xF0\x9F\x93\x84 " + result.file);  // U+1F4C4 page facing up

    for (const auto& section : result.sections) {
      output.push_back("\n  \xC2\xA7 " + section.header + " (line " +
                       std::to_string(section.line) + ")");

      std::vector<std::string> indented;
      for (const auto& l : core::split_lines(section.content)) {
        indented.push_back("    " + l);
      }
      output.push_back("  " + core::join(indented, "\n"));
    }
  }

  return core::join(output, "\n");
}

}  // namespace

DocumentationTool::DocumentationTool(std::filesystem::path docs_root)
    : docs_root_(std::move(docs_root)) {}

std::string DocumentationTool::description() const {
  return "Search and retrieve Inertia-rails documentation";
}

json DocumentationTool::input_schema() const {
  return json{
      {"type", "object"},
      {"properties",
       {
           {"query",
            {{"type", "string"},
             {"description",
              "Search query for documentation (e.g., \"render\", \"props\", \"shared data\")"}}},
           {"category",
            {{"type", "string"},
             {"enum", json::array({"guide", "cookbook", "api", "all"})},
             {"description", "Documentation category to search in"},
             {"default", "all"}}},
       }},
      {"required", json::array({"query"})},
  };
}

std::string DocumentationTool::call(const json& arguments) const {
  const std::string query = require_string(arguments, "query");
  const std::string category = optional_string(arguments, "category").value_or("all");

  if (std::find(kCategories.begin(), kCategories.end(), category) == kCategories.end()) {
    throw capability::InvalidArgumentsError("Unknown documentation category: " + category);
  }

  std::vector<FileMatch> results;
  for (const auto& path : corpus::list_markdown_files(search_root(docs_root_, category))) {
    auto text = corpus::read_text_file(path);
    if (!text.has_value() || !core::contains_ignore_case(text.value(), query)) {
      continue;
    }

    auto sections = extract_relevant_sections(text.value(), query);
    if (sections.empty()) {
      continue;
    }

    results.push_back({path.lexically_relative(docs_root_).generic_string(), std::move(sections)});
  }

  if (results.empty()) {
    return "No documentation found for '" + query + "'";
  }
  return format_results(results, query);
}

std::vector<DocSection> extract_relevant_sections(const std::string& content,
                                                  const std::string& query,
                                                  const std::size_t max_sections) {
  std::vector<DocSection> sections;
  const auto lines = core::split_lines(content);
  const std::string needle = core::normalize_ascii_lower(query);

  for (std::size_t index = 0; index < lines.size() && sections.size() < max_sections; ++index) {
    if (core::normalize_ascii_lower(lines[index]).find(needle) == std::string::npos) {
      continue;
    }

    const std::size_t context_start = index >= 2 ? index - 2 : 0;
    const std::size_t context_end = std::min(index + 2, lines.size() - 1);
    std::vector<std::string> context(lines.begin() + static_cast<std::ptrdiff_t>(context_start),
                                     lines.begin() + static_cast<std::ptrdiff_t>(context_end) + 1);

    sections.push_back({find_section_header(lines, index), core::trim(core::join(context, "\n")),
                        index + 1});
  }

  return sections;
}

}  // namespace irmcp::tools
