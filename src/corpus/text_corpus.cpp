#include "irmcp/corpus/text_corpus.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace irmcp::corpus {

TextResult read_text_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return TextResult::err(CorpusError{"Not a readable file: " + path.string()});
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return TextResult::err(CorpusError{"Failed to open file: " + path.string()});
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return TextResult::err(CorpusError{"Failed to read file: " + path.string()});
  }

  return TextResult::ok(buffer.str());
}

std::vector<std::filesystem::path> list_markdown_files(const std::filesystem::path& root) {
  std::vector<std::filesystem::path> files;

  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return files;
  }

  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  const std::filesystem::recursive_directory_iterator end;
  while (!ec && it != end) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) && it->path().extension() == ".md") {
      files.push_back(it->path());
    }
    it.increment(ec);
  }

  // Directory iteration order is unspecified; sort for deterministic output.
  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace irmcp::corpus
