#include "irmcp/tools/changelog_tool.h"

#include "irmcp/core/normalization.h"
#include "irmcp/corpus/text_corpus.h"
#include "irmcp/tools/tool_arguments.h"

#include <algorithm>
#include <optional>
#include <iterator>
#include <regex>
#include <vector>

namespace irmcp::tools {

using json = nlohmann::json;

namespace {

constexpr std::size_t kLatestFallbackLines = 50;

const std::regex& version_header_pattern() {
  static const std::regex pattern(R"(^##?\s*\[?v?(\d+\.\d+\.\d+))");
  return pattern;
}

std::optional<std::string> header_version(const std::string& line) {
  std::smatch match;
  if (std::regex_search(line, match, version_header_pattern())) {
    return match[1].str();
  }
  return std::nullopt;
}

std::string regex_escape(const std::string& text) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{}-)";
  std::string escaped;
  for (const char ch : text) {
    if (kSpecial.find(ch) != std::string::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  return escaped;
}

// Lines [start, next version header) joined and trimmed. When there is no later header,
// at most fallback_limit lines are taken (unbounded when fallback_limit is 0).
std::string section_from(const std::vector<std::string>& lines, const std::size_t start,
                         const std::size_t fallback_limit) {
  std::size_t end = start + 1;
  while (end < lines.size() && !header_version(lines[end]).has_value()) {
    ++end;
  }
  if (end == lines.size() && fallback_limit > 0) {
    end = std::min(lines.size(), start + fallback_limit);
  }
  return core::trim(core::join(
      std::vector<std::string>(lines.begin() + static_cast<std::ptrdiff_t>(start),
                               lines.begin() + static_cast<std::ptrdiff_t>(end)),
      "\n"));
}

}  // namespace

std::string changelog_version_info(const std::string& content, const std::string& version) {
  if (version == "latest") {
    return changelog_latest_changes(content);
  }

  const std::regex pattern("^##?\\s*\\[?v?" + regex_escape(version),
                           std::regex::ECMAScript | std::regex::icase);
  const auto lines = core::split_lines(content);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (std::regex_search(lines[i], pattern)) {
      return "\xF0\x9F\x93\x8B Version " + version + ":\n\n" + section_from(lines, i, 0);
    }
  }

  return "Version " + version + " not found in changelog";
}

std::string changelog_latest_changes(const std::string& content) {
  const auto lines = core::split_lines(content);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (header_version(lines[i]).has_value()) {
      return "\xF0\x9F\x93\x8B Latest changes:\n\n" + section_from(lines, i, kLatestFallbackLines);
    }
  }
  return "No version information found";
}

std::string changelog_search(const std::string& content, const std::string& search) {
  struct VersionHits {
    std::string version;
    std::vector<std::string> lines;
  };
  std::vector<VersionHits> grouped;
  std::optional<std::string> current_version;

  for (const auto& line : core::split_lines(content)) {
    if (auto version = header_version(line)) {
      current_version = std::move(version);
    }
    if (!current_version.has_value() || !core::contains_ignore_case(line, search)) {
      continue;
    }
    auto group = std::find_if(grouped.begin(), grouped.end(), [&](const VersionHits& hits) {
      return hits.version == current_version.value();
    });
    if (group == grouped.end()) {
      grouped.push_back({current_version.value(), {}});
      group = std::prev(grouped.end());
    }
    group->lines.push_back(core::trim(line));
  }

  if (grouped.empty()) {
    return "No results found for '" + search + "'";
  }

  std::vector<std::string> output;
  output.push_back("\xF0\x9F\x94\x8D Search results for '" + search + "':\n");
  for (const auto& group : grouped) {
    output.push_back("\n\xF0\x9F\x93\x8C Version " + group.version + ":");
    for (const auto& hit : group.lines) {
      output.push_back("  \xE2\x80\xA2 " + hit);
    }
  }
  return core::join(output, "\n");
}

ChangelogTool::ChangelogTool(std::filesystem::path changelog_path)
    : changelog_path_(std::move(changelog_path)) {}

std::string ChangelogTool::description() const {
  return "Look up changes, new features, and breaking changes in Inertia-rails versions";
}

json ChangelogTool::input_schema() const {
  return json{
      {"type", "object"},
      {"properties",
       {
           {"version",
            {{"type", "string"},
             {"description", "Specific version to look up (e.g., \"3.0.0\") or \"latest\""}}},
           {"search",
            {{"type", "string"}, {"description", "Search for specific features or changes"}}},
       }},
  };
}

std::string ChangelogTool::call(const json& arguments) const {
  const auto version = optional_string(arguments, "version");
  const auto search = optional_string(arguments, "search");

  auto content = corpus::read_text_file(changelog_path_);
  if (!content.has_value()) {
    return "CHANGELOG.md not found";
  }

  if (version.has_value() && !version->empty()) {
    return changelog_version_info(content.value(), version.value());
  }
  if (search.has_value() && !search->empty()) {
    return changelog_search(content.value(), search.value());
  }
  return changelog_latest_changes(content.value());
}

}  // namespace irmcp::tools
