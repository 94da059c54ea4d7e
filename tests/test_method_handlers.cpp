#include "irmcp/capability/capability_registry.h"
#include "irmcp/core/version.h"

#include <catch2/catch.hpp>

#include "method_handlers.h"
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace irmcp;
using namespace irmcp::mcp;
using json = nlohmann::json;

namespace {

class GreetTool : public capability::ITool {
 public:
  [[nodiscard]] std::string description() const override { return "Greets someone"; }
  [[nodiscard]] json input_schema() const override {
    return json{{"type", "object"},
                {"properties", {{"who", {{"type", "string"}}}}},
                {"required", json::array({"who"})}};
  }
  [[nodiscard]] std::string call(const json& arguments) const override {
    auto it = arguments.find("who");
    if (it == arguments.end() || !it->is_string()) {
      throw capability::InvalidArgumentsError("'who' is required");
    }
    return "hello " + it->get<std::string>();
  }
};

class CountArgsTool : public capability::ITool {
 public:
  [[nodiscard]] std::string description() const override { return "Counts arguments"; }
  [[nodiscard]] json input_schema() const override { return json{{"type", "object"}}; }
  [[nodiscard]] std::string call(const json& arguments) const override {
    return std::to_string(arguments.size());
  }
};

class FailingTool : public capability::ITool {
 public:
  [[nodiscard]] std::string description() const override { return "Always fails"; }
  [[nodiscard]] json input_schema() const override { return json{{"type", "object"}}; }
  [[nodiscard]] std::string call(const json& /*arguments*/) const override {
    throw std::runtime_error("disk on fire");
  }
};

class NotesResource : public capability::IResource {
 public:
  [[nodiscard]] std::string name() const override { return "Notes"; }
  [[nodiscard]] std::string description() const override { return "Release notes"; }
  [[nodiscard]] std::string mime_type() const override { return "text/markdown"; }
  [[nodiscard]] std::string content() const override { return "# Notes\n\nAll good."; }
};

capability::CapabilityRegistry make_registry() {
  std::vector<capability::ToolEntry> tools;
  tools.emplace_back("greet", std::make_unique<GreetTool>());
  tools.emplace_back("count", std::make_unique<CountArgsTool>());
  tools.emplace_back("fail", std::make_unique<FailingTool>());

  std::vector<capability::ResourceEntry> resources;
  resources.emplace_back("notes", std::make_unique<NotesResource>());

  return capability::CapabilityRegistry(std::move(tools), std::move(resources));
}

JsonRpcRequest request(const std::string& method, json params = json::object(), json id = 1) {
  return JsonRpcRequest{std::move(id), method, std::move(params)};
}

const json& result_of(const JsonRpcResponse& response) {
  REQUIRE_FALSE(response.is_error());
  return std::get<json>(response.payload);
}

const JsonRpcError& error_of(const JsonRpcResponse& response) {
  REQUIRE(response.is_error());
  return std::get<JsonRpcError>(response.payload);
}

// Redirects std::cerr into a buffer for the lifetime of the object.
class StderrCapture {
 public:
  StderrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~StderrCapture() { std::cerr.rdbuf(previous_); }

  StderrCapture(const StderrCapture&) = delete;
  StderrCapture& operator=(const StderrCapture&) = delete;

  [[nodiscard]] std::string text() const { return buffer_.str(); }

 private:
  std::ostringstream buffer_;
  std::streambuf* previous_;
};

}  // namespace

// ── Method vocabulary ───────────────────────────────────────────────────────

TEST_CASE("parse_method recognises exactly the six methods", "[dispatch][method]") {
  for (const auto method :
       {Method::kInitialize, Method::kToolsList, Method::kToolsCall, Method::kResourcesList,
        Method::kResourcesRead, Method::kCompletionComplete}) {
    auto parsed = parse_method(std::string(to_string(method)));
    REQUIRE(parsed.has_value());
    CHECK(parsed.value() == method);
  }

  CHECK_FALSE(parse_method("Initialize").has_value());
  CHECK_FALSE(parse_method("prompts/list").has_value());
  CHECK_FALSE(parse_method("").has_value());
}

// ── initialize ──────────────────────────────────────────────────────────────

TEST_CASE("initialize advertises version, capabilities and identity", "[dispatch][initialize]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto response = dispatch(request("initialize", json::object(), 1), ctx);
  const auto& result = result_of(response);

  CHECK(response.id == 1);
  CHECK(result["protocolVersion"] == core::kProtocolVersion);
  CHECK(result["capabilities"]["tools"] == json::object());
  CHECK(result["capabilities"]["resources"] == json::object());
  CHECK(result["capabilities"]["completion"] == json::object());
  CHECK(result["serverInfo"]["name"] == core::kServerName);
  CHECK(result["serverInfo"]["version"] == core::kBuildVersion);
  CHECK(result["serverInfo"]["protocol_version"] == core::kProtocolVersion);
}

// ── Request logging ─────────────────────────────────────────────────────────

TEST_CASE("dispatch logs the canonical method name unless quiet", "[dispatch][logging]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  {
    StderrCapture captured;
    (void)dispatch(request("tools/list"), ctx);
    (void)dispatch(request("prompts/list"), ctx);
    CHECK(captured.text() == "Received: tools/list\nReceived unknown method: prompts/list\n");
  }

  config.log_requests = false;
  {
    StderrCapture captured;
    (void)dispatch(request("tools/list"), ctx);
    CHECK(captured.text().empty());
  }
}

// ── Unknown method ──────────────────────────────────────────────────────────

TEST_CASE("unknown method yields -32601 naming the method", "[dispatch][routing]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto response = dispatch(request("prompts/list", json::object(), "abc"), ctx);

  CHECK(response.id == "abc");
  const auto& error = error_of(response);
  CHECK(error.code == kMethodNotFound);
  CHECK(error.message.find("prompts/list") != std::string::npos);
}

// ── tools/list ──────────────────────────────────────────────────────────────

TEST_CASE("tools/list returns every tool in registry order", "[dispatch][tools]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto first = dispatch(request("tools/list"), ctx);
  auto second = dispatch(request("tools/list"), ctx);
  const auto& tools = result_of(first)["tools"];

  REQUIRE(tools.size() == registry.tool_count());
  CHECK(tools[0]["name"] == "inertia_rails_greet");
  CHECK(tools[1]["name"] == "inertia_rails_count");
  CHECK(tools[2]["name"] == "inertia_rails_fail");
  CHECK(tools[0]["description"] == "Greets someone");
  CHECK(tools[0]["inputSchema"]["required"][0] == "who");
  CHECK(result_of(first) == result_of(second));
}

// ── tools/call ──────────────────────────────────────────────────────────────

TEST_CASE("tools/call wraps tool output in a single text block", "[dispatch][tools]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto response = dispatch(
      request("tools/call", {{"name", "inertia_rails_greet"}, {"arguments", {{"who", "ada"}}}}),
      ctx);
  const auto& content = result_of(response)["content"];

  REQUIRE(content.size() == 1);
  CHECK(content[0]["type"] == "text");
  CHECK(content[0]["text"] == "hello ada");
}

TEST_CASE("tools/call passes an empty object when arguments are omitted", "[dispatch][tools]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto response = dispatch(request("tools/call", {{"name", "inertia_rails_count"}}), ctx);
  CHECK(result_of(response)["content"][0]["text"] == "0");
}

TEST_CASE("tools/call with an unknown or unprefixed name yields -32602", "[dispatch][tools]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  for (const char* name : {"inertia_rails_missing", "greet", "other_greet"}) {
    auto response = dispatch(request("tools/call", {{"name", name}}), ctx);
    const auto& error = error_of(response);
    CHECK(error.code == kInvalidParams);
    CHECK(error.message == std::string("Tool not found: ") + name);
  }
}

TEST_CASE("tools/call validates its own params", "[dispatch][tools]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  CHECK(error_of(dispatch(request("tools/call"), ctx)).code == kInvalidParams);
  CHECK(error_of(dispatch(request("tools/call", {{"name", 42}}), ctx)).code == kInvalidParams);
  CHECK(error_of(dispatch(request("tools/call", {{"name", "inertia_rails_greet"},
                                                 {"arguments", json::array({1})}}),
                          ctx))
            .code == kInvalidParams);
}

TEST_CASE("tools/call maps invalid tool arguments to -32602", "[dispatch][tools]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto response = dispatch(request("tools/call", {{"name", "inertia_rails_greet"}}), ctx);
  const auto& error = error_of(response);
  CHECK(error.code == kInvalidParams);
  CHECK(error.message == "Invalid params: 'who' is required");
}

TEST_CASE("tools/call lets capability failures propagate to the loop boundary",
          "[dispatch][tools]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  CHECK_THROWS_AS(dispatch(request("tools/call", {{"name", "inertia_rails_fail"}}), ctx),
                  std::runtime_error);
}

// ── resources ───────────────────────────────────────────────────────────────

TEST_CASE("resources/list returns descriptors with synthesized URIs", "[dispatch][resources]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto first = dispatch(request("resources/list"), ctx);
  const auto& resources = result_of(first)["resources"];

  REQUIRE(resources.size() == 1);
  CHECK(resources[0]["uri"] == "inertia-rails://notes");
  CHECK(resources[0]["name"] == "Notes");
  CHECK(resources[0]["description"] == "Release notes");
  CHECK(resources[0]["mimeType"] == "text/markdown");
  CHECK(result_of(dispatch(request("resources/list"), ctx)) == result_of(first));
}

TEST_CASE("resources/read returns content addressed by the original URI",
          "[dispatch][resources]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto response = dispatch(request("resources/read", {{"uri", "inertia-rails://notes"}}), ctx);
  const auto& contents = result_of(response)["contents"];

  REQUIRE(contents.size() == 1);
  CHECK(contents[0]["uri"] == "inertia-rails://notes");
  CHECK(contents[0]["mimeType"] == "text/markdown");
  CHECK(contents[0]["text"] == registry.lookup_resource("notes")->content());
}

TEST_CASE("resources/read with unknown key, wrong scheme or no uri is an error",
          "[dispatch][resources]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  auto unknown = dispatch(request("resources/read", {{"uri", "inertia-rails://nope"}}), ctx);
  CHECK(error_of(unknown).code == kInvalidParams);
  CHECK(error_of(unknown).message == "Resource not found: inertia-rails://nope");

  auto wrong_scheme = dispatch(request("resources/read", {{"uri", "https://notes"}}), ctx);
  CHECK(error_of(wrong_scheme).code == kInvalidParams);

  auto missing = dispatch(request("resources/read"), ctx);
  CHECK(error_of(missing).code == kInvalidParams);
}

// ── completion/complete ─────────────────────────────────────────────────────

TEST_CASE("completion suggests helpers only for the method argument", "[dispatch][completion]") {
  const auto registry = make_registry();
  McpServerConfig config;
  ServerContext ctx{registry, config};

  const json params = {{"ref", {{"type", "ref/prompt"}}},
                       {"argument", {{"name", "method"}, {"value", ""}}}};
  auto triggered = dispatch(request("completion/complete", params), ctx);
  const auto& completion = result_of(triggered)["completion"];
  REQUIRE(completion["values"].size() == 5);
  CHECK(completion["values"][0]["value"] == "render inertia:");
  CHECK(completion["total"] == 5);
  CHECK(completion["hasMore"] == false);

  auto other = dispatch(
      request("completion/complete", {{"argument", {{"name", "component"}}}}), ctx);
  CHECK(result_of(other)["completion"]["values"].empty());
  CHECK(result_of(other)["completion"]["total"] == 0);
  CHECK(result_of(other)["completion"]["hasMore"] == false);

  auto bare = dispatch(request("completion/complete"), ctx);
  CHECK(result_of(bare)["completion"]["values"].empty());
}
