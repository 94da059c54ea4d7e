#pragma once

#include "irmcp/core/result.h"

#include <filesystem>
#include <string>
#include <vector>

namespace irmcp::corpus {

/// Locations of the read-only text corpus consulted by the documentation and changelog tools.
struct CorpusPaths {
  std::filesystem::path docs_root{"docs"};          // NOLINT(readability-identifier-naming)
  std::filesystem::path changelog{"CHANGELOG.md"};  // NOLINT(readability-identifier-naming)
};

/// Error type for corpus read failures
struct CorpusError {
  std::string message;  // NOLINT(readability-identifier-naming)
};

using TextResult = core::Result<std::string, CorpusError>;

/// Read a whole file as bytes into a string. Fails if the file is missing or unreadable.
[[nodiscard]] TextResult read_text_file(const std::filesystem::path& path);

/// Recursively collect every "*.md" regular file under root, sorted by path.
/// Returns an empty list when root is not a directory. Unreadable subtrees are skipped.
[[nodiscard]] std::vector<std::filesystem::path> list_markdown_files(
    const std::filesystem::path& root);

}  // namespace irmcp::corpus
