#include "framing.h"

#include "irmcp/core/normalization.h"

#include <algorithm>
#include <charconv>
#include <limits>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace irmcp::mcp {

using json = nlohmann::json;

namespace {

constexpr const char* kContentLengthHeader = "content-length";
constexpr std::size_t kReadChunkSize = 64 * 1024;

enum class LineStatus : uint8_t {
  kLine,
  kTooLong,
  kEndOfStream,
};

FrameReadResult skipped(std::string diagnostic) {
  FrameReadResult result;
  result.status = ReadStatus::kSkipped;
  result.diagnostic = std::move(diagnostic);
  return result;
}

FrameReadResult end_of_stream() { return FrameReadResult{}; }

std::optional<std::size_t> parse_content_length(const std::string& value) {
  std::size_t length = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, length);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return length;
}

// Reads exactly length bytes in bounded chunks so that a bogus length cannot force a huge
// up-front allocation. Returns std::nullopt if the stream ends first.
std::optional<std::string> read_body(std::istream& in, const std::size_t length) {
  std::string body;
  std::vector<char> buffer(std::min(kReadChunkSize, length));
  while (body.size() < length) {
    const std::size_t want = std::min(buffer.size(), length - body.size());
    in.read(buffer.data(), static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(in.gcount());
    body.append(buffer.data(), got);
    if (got < want) {
      return std::nullopt;
    }
  }
  return body;
}

// Reads one '\n'-terminated line into line, keeping at most kMaxHeaderLineLength bytes.
// The rest of an overlong line is discarded through its terminator without being buffered.
// EOF before the terminator counts as end of stream.
LineStatus read_header_line(std::istream& in, std::string& line) {
  using traits = std::istream::traits_type;
  line.clear();
  for (auto ch = in.get(); !traits::eq_int_type(ch, traits::eof()); ch = in.get()) {
    const char c = traits::to_char_type(ch);
    if (c == '\n') {
      return LineStatus::kLine;
    }
    if (line.size() == kMaxHeaderLineLength) {
      in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
      return LineStatus::kTooLong;
    }
    line.push_back(c);
  }
  return LineStatus::kEndOfStream;
}

}  // namespace

std::optional<std::pair<std::string, std::string>> parse_header_line(const std::string& line) {
  const auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0) {
    return std::nullopt;
  }

  std::string value = core::trim(std::string_view(line).substr(colon + 1));
  if (value.empty()) {
    return std::nullopt;
  }

  return std::make_pair(core::normalize_ascii_lower(line.substr(0, colon)), std::move(value));
}

FrameReadResult read_frame(std::istream& in) {
  std::unordered_map<std::string, std::string> headers;

  // Header block ends at the first empty line.
  std::string line;
  while (true) {
    switch (read_header_line(in, line)) {
      case LineStatus::kEndOfStream:
        return end_of_stream();
      case LineStatus::kTooLong:
        return skipped("Header line longer than " + std::to_string(kMaxHeaderLineLength) +
                       " bytes ignored");
      case LineStatus::kLine:
        break;
    }
    line = core::trim(line);
    if (line.empty()) {
      break;
    }
    if (auto header = parse_header_line(line)) {
      headers[header->first] = std::move(header->second);
    }
  }

  auto it = headers.find(kContentLengthHeader);
  if (it == headers.end()) {
    return skipped("Frame without Content-Length header ignored");
  }

  auto length = parse_content_length(it->second);
  if (!length.has_value()) {
    return skipped("Invalid Content-Length: " + it->second);
  }

  auto body = read_body(in, length.value());
  if (!body.has_value()) {
    return end_of_stream();
  }

  FrameReadResult result;
  try {
    result.document = json::parse(body.value());
  } catch (const json::parse_error& e) {
    return skipped(std::string("Failed to parse JSON: ") + e.what());
  }
  result.status = ReadStatus::kMessage;
  return result;
}

std::string encode_frame(const json& body) {
  // Replace invalid UTF-8 coming from corpus files instead of throwing mid-write.
  const std::string text = body.dump(-1, ' ', false, json::error_handler_t::replace);
  return "Content-Length: " + std::to_string(text.size()) + "\r\n\r\n" + text;
}

void write_frame(std::ostream& out, const json& body) {
  out << encode_frame(body);
  out.flush();
}

}  // namespace irmcp::mcp
