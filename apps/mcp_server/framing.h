#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace irmcp::mcp {

// Header-framed message codec used on stdin/stdout:
//
//   Content-Length: <N>\r\n
//   \r\n
//   <N bytes of UTF-8 JSON>
//
// Only Content-Length is meaningful; its name is matched case-insensitively.
// Bare "\n" line endings are accepted on input.

// Longest header line accepted, terminator excluded. Longer lines are discarded unbuffered
// and reported as kSkipped.
constexpr std::size_t kMaxHeaderLineLength = 8 * 1024;

enum class ReadStatus : uint8_t {
  kMessage,      // document holds the decoded body
  kSkipped,      // frame was unusable (no length, bad length, overlong header, bad JSON)
  kEndOfStream,  // input closed before a complete frame arrived
};

struct FrameReadResult {
  ReadStatus status{ReadStatus::kEndOfStream};  // NOLINT(readability-identifier-naming)
  nlohmann::json document;                      // NOLINT(readability-identifier-naming)
  std::string diagnostic;  // NOLINT(readability-identifier-naming) set for kSkipped
};

// parse_header_line splits "Name: Value" into a lowercased name and its value.
// Lines that do not have that shape yield std::nullopt.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> parse_header_line(
    const std::string& line);

// read_frame blocks until one frame has been consumed from in, or in is exhausted.
[[nodiscard]] FrameReadResult read_frame(std::istream& in);

// encode_frame serializes body and prefixes the header block.
// Content-Length counts bytes of the serialized body, not characters.
[[nodiscard]] std::string encode_frame(const nlohmann::json& body);

// write_frame writes encode_frame(body) to out and flushes immediately.
void write_frame(std::ostream& out, const nlohmann::json& body);

}  // namespace irmcp::mcp
