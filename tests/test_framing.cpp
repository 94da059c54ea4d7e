#include <catch2/catch.hpp>

#include "framing.h"
#include <sstream>
#include <string>

using namespace irmcp::mcp;
using json = nlohmann::json;

namespace {

std::string frame_text(const std::string& body) {
  return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

}  // namespace

// ── Header parsing ──────────────────────────────────────────────────────────

TEST_CASE("parse_header_line lowercases the name and trims the value", "[framing][header]") {
  auto header = parse_header_line("Content-Length:   42");
  REQUIRE(header.has_value());
  CHECK(header->first == "content-length");
  CHECK(header->second == "42");
}

TEST_CASE("parse_header_line rejects lines without Name: Value shape", "[framing][header]") {
  CHECK_FALSE(parse_header_line("no colon here").has_value());
  CHECK_FALSE(parse_header_line(": value without name").has_value());
  CHECK_FALSE(parse_header_line("Name-Only:").has_value());
  CHECK_FALSE(parse_header_line("Name-Only:   ").has_value());
}

// ── Decode ──────────────────────────────────────────────────────────────────

TEST_CASE("read_frame decodes a well-formed frame", "[framing][decode]") {
  std::istringstream in(frame_text(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"));

  auto frame = read_frame(in);

  REQUIRE(frame.status == ReadStatus::kMessage);
  CHECK(frame.document["method"] == "initialize");
  CHECK(frame.document["id"] == 1);
}

TEST_CASE("read_frame matches Content-Length case-insensitively", "[framing][decode]") {
  const std::string body = R"({"method":"tools/list"})";
  std::istringstream in("CONTENT-LENGTH: " + std::to_string(body.size()) + "\n\n" + body);

  auto frame = read_frame(in);

  REQUIRE(frame.status == ReadStatus::kMessage);
  CHECK(frame.document["method"] == "tools/list");
}

TEST_CASE("read_frame ignores malformed and unknown header lines", "[framing][decode]") {
  const std::string body = R"({"method":"tools/list"})";
  std::istringstream in("garbage line\r\nContent-Type: application/json\r\nContent-Length: " +
                        std::to_string(body.size()) + "\r\n\r\n" + body);

  auto frame = read_frame(in);

  REQUIRE(frame.status == ReadStatus::kMessage);
  CHECK(frame.document["method"] == "tools/list");
}

TEST_CASE("read_frame reads exactly Content-Length bytes", "[framing][decode]") {
  const std::string first = R"({"id":1,"method":"a"})";
  const std::string second = R"({"id":2,"method":"b"})";
  std::istringstream in(frame_text(first) + frame_text(second));

  auto one = read_frame(in);
  auto two = read_frame(in);
  auto three = read_frame(in);

  REQUIRE(one.status == ReadStatus::kMessage);
  REQUIRE(two.status == ReadStatus::kMessage);
  CHECK(one.document["id"] == 1);
  CHECK(two.document["id"] == 2);
  CHECK(three.status == ReadStatus::kEndOfStream);
}

TEST_CASE("read_frame reports end of stream on empty input", "[framing][decode]") {
  std::istringstream in("");
  CHECK(read_frame(in).status == ReadStatus::kEndOfStream);
}

TEST_CASE("read_frame reports end of stream when the body is truncated", "[framing][decode]") {
  std::istringstream in("Content-Length: 5\r\n\r\n{}1");
  CHECK(read_frame(in).status == ReadStatus::kEndOfStream);
}

TEST_CASE("read_frame reports end of stream inside the header block", "[framing][decode]") {
  std::istringstream in("Content-Length: 10\r\n");
  CHECK(read_frame(in).status == ReadStatus::kEndOfStream);
}

TEST_CASE("read_frame skips a frame without Content-Length and keeps going",
          "[framing][decode]") {
  const std::string body = R"({"method":"tools/list"})";
  std::istringstream in("X-Other: 1\r\n\r\n" + frame_text(body));

  auto skipped = read_frame(in);
  CHECK(skipped.status == ReadStatus::kSkipped);
  CHECK_FALSE(skipped.diagnostic.empty());

  auto next = read_frame(in);
  REQUIRE(next.status == ReadStatus::kMessage);
  CHECK(next.document["method"] == "tools/list");
}

TEST_CASE("read_frame skips a non-numeric Content-Length", "[framing][decode]") {
  std::istringstream in("Content-Length: abc\r\n\r\n");
  auto frame = read_frame(in);
  CHECK(frame.status == ReadStatus::kSkipped);
  CHECK(frame.diagnostic.find("abc") != std::string::npos);
}

TEST_CASE("read_frame skips a body that is not valid JSON", "[framing][decode]") {
  const std::string good = R"({"method":"initialize"})";
  std::istringstream in(frame_text("{not json") + frame_text(good));

  auto bad = read_frame(in);
  CHECK(bad.status == ReadStatus::kSkipped);
  CHECK(bad.diagnostic.starts_with("Failed to parse JSON"));

  auto next = read_frame(in);
  REQUIRE(next.status == ReadStatus::kMessage);
  CHECK(next.document["method"] == "initialize");
}

TEST_CASE("read_frame skips an overlong header line and resumes after it", "[framing][decode]") {
  const std::string good = R"({"method":"tools/list"})";
  const std::string overlong(kMaxHeaderLineLength * 4, 'x');
  std::istringstream in(overlong + "\r\n" + frame_text(good));

  auto skipped = read_frame(in);
  CHECK(skipped.status == ReadStatus::kSkipped);
  CHECK(skipped.diagnostic.find(std::to_string(kMaxHeaderLineLength)) != std::string::npos);

  auto next = read_frame(in);
  REQUIRE(next.status == ReadStatus::kMessage);
  CHECK(next.document["method"] == "tools/list");
}

TEST_CASE("read_frame stops at end of stream after an unterminated overlong line",
          "[framing][decode]") {
  std::istringstream in(std::string(kMaxHeaderLineLength + 1, 'x'));

  CHECK(read_frame(in).status == ReadStatus::kSkipped);
  CHECK(read_frame(in).status == ReadStatus::kEndOfStream);
}

TEST_CASE("read_frame accepts a header line of exactly the maximum length", "[framing][decode]") {
  const std::string body = "{}";
  const std::string prefix = "X-Padding: ";
  const std::string padding(kMaxHeaderLineLength - prefix.size(), 'p');
  std::istringstream in(prefix + padding + "\n" + frame_text(body));

  auto frame = read_frame(in);
  REQUIRE(frame.status == ReadStatus::kMessage);
  CHECK(frame.document == json::object());
}

// ── Encode ──────────────────────────────────────────────────────────────────

TEST_CASE("encode_frame declares the byte length of the body", "[framing][encode]") {
  const std::string text = "caf\xC3\xA9 \xF0\x9F\x93\x84";
  json body = {{"jsonrpc", "2.0"}, {"id", 7}, {"result", {{"text", text}}}};

  const std::string frame = encode_frame(body);
  const auto separator = frame.find("\r\n\r\n");
  REQUIRE(separator != std::string::npos);

  const std::string header = frame.substr(0, separator);
  const std::string payload = frame.substr(separator + 4);
  CHECK(header == "Content-Length: " + std::to_string(payload.size()));
  CHECK(json::parse(payload) == body);
}

TEST_CASE("write_frame output is readable by read_frame", "[framing][encode]") {
  json body = {{"jsonrpc", "2.0"}, {"id", "abc"}, {"result", json::object()}};
  std::stringstream stream;

  write_frame(stream, body);
  auto frame = read_frame(stream);

  REQUIRE(frame.status == ReadStatus::kMessage);
  CHECK(frame.document == body);
}

TEST_CASE("encode_frame replaces invalid UTF-8 instead of throwing", "[framing][encode]") {
  json body = {{"text", std::string("bad \xFF byte")}};
  std::string frame;
  REQUIRE_NOTHROW(frame = encode_frame(body));
  CHECK(frame.starts_with("Content-Length: "));
}
