#include "method_handlers.h"

#include "irmcp/core/version.h"

#include <iostream>

namespace irmcp::mcp {

using json = nlohmann::json;

namespace {

json completion_suggestions(const std::string& argument_name) {
  json values = json::array();
  if (argument_name != kCompletionTriggerArgument) {
    return values;
  }

  values.push_back({{"value", "render inertia:"}, {"description", "Render an Inertia response"}});
  values.push_back(
      {{"value", "inertia_share"}, {"description", "Share data across all Inertia responses"}});
  values.push_back({{"value", "use_inertia_instance_props"},
                    {"description", "Use instance variables as props"}});
  values.push_back({{"value", "inertia_config"}, {"description", "Configure Inertia settings"}});
  values.push_back({{"value", "inertia_location"}, {"description", "Redirect with Inertia"}});
  return values;
}

}  // namespace

std::optional<Method> parse_method(const std::string& name) {
  if (name == "initialize") {
    return Method::kInitialize;
  }
  if (name == "tools/list") {
    return Method::kToolsList;
  }
  if (name == "tools/call") {
    return Method::kToolsCall;
  }
  if (name == "resources/list") {
    return Method::kResourcesList;
  }
  if (name == "resources/read") {
    return Method::kResourcesRead;
  }
  if (name == "completion/complete") {
    return Method::kCompletionComplete;
  }
  return std::nullopt;
}

std::string_view to_string(Method method) {
  switch (method) {
    case Method::kInitialize:
      return "initialize";
    case Method::kToolsList:
      return "tools/list";
    case Method::kToolsCall:
      return "tools/call";
    case Method::kResourcesList:
      return "resources/list";
    case Method::kResourcesRead:
      return "resources/read";
    case Method::kCompletionComplete:
      return "completion/complete";
  }
  return "unknown";  // unreachable: every enumerator is handled above
}

JsonRpcResponse handle_initialize(const JsonRpcRequest& req, ServerContext& /*ctx*/) {
  return make_response(
      req.id,
      json{
          {"protocolVersion", core::kProtocolVersion},
          {"capabilities",
           {
               {"tools", json::object()},
               {"resources", json::object()},
               {"completion", json::object()},
           }},
          {"serverInfo",
           {
               {"name", core::kServerName},
               {"version", core::kBuildVersion},
               {"protocol_version", core::kProtocolVersion},
           }},
      });
}

JsonRpcResponse handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx) {
  json tools = json::array();
  for (const auto& descriptor : ctx.registry.list_tools()) {
    tools.push_back({
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"inputSchema", descriptor.input_schema},
    });
  }
  return make_response(req.id, json{{"tools", tools}});
}

JsonRpcResponse handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  auto name_it = req.params.find("name");
  if (name_it == req.params.end() || !name_it->is_string()) {
    return make_error_response(req.id, kInvalidParams, "Invalid params: 'name' must be a string");
  }
  const std::string tool_name = name_it->get<std::string>();

  json arguments = json::object();
  auto args_it = req.params.find("arguments");
  if (args_it != req.params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      return make_error_response(req.id, kInvalidParams,
                                 "Invalid params: 'arguments' must be an object");
    }
    arguments = *args_it;
  }

  const capability::ITool* tool = ctx.registry.resolve_tool(tool_name);
  if (tool == nullptr) {
    return make_error_response(req.id, kInvalidParams, "Tool not found: " + tool_name);
  }

  std::string text;
  try {
    text = tool->call(arguments);
  } catch (const capability::InvalidArgumentsError& e) {
    return make_error_response(req.id, kInvalidParams, std::string("Invalid params: ") + e.what());
  }

  json content = json::array();
  content.push_back({{"type", "text"}, {"text", std::move(text)}});
  return make_response(req.id, json{{"content", content}});
}

JsonRpcResponse handle_resources_list(const JsonRpcRequest& req, ServerContext& ctx) {
  json resources = json::array();
  for (const auto& descriptor : ctx.registry.list_resources()) {
    resources.push_back({
        {"uri", descriptor.uri},
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"mimeType", descriptor.mime_type},
    });
  }
  return make_response(req.id, json{{"resources", resources}});
}

JsonRpcResponse handle_resources_read(const JsonRpcRequest& req, ServerContext& ctx) {
  auto uri_it = req.params.find("uri");
  if (uri_it == req.params.end() || !uri_it->is_string()) {
    return make_error_response(req.id, kInvalidParams, "Invalid params: 'uri' must be a string");
  }
  const std::string uri = uri_it->get<std::string>();

  const capability::IResource* resource = ctx.registry.resolve_resource(uri);
  if (resource == nullptr) {
    return make_error_response(req.id, kInvalidParams, "Resource not found: " + uri);
  }

  json contents = json::array();
  contents.push_back({
      {"uri", uri},
      {"mimeType", resource->mime_type()},
      {"text", resource->content()},
  });
  return make_response(req.id, json{{"contents", contents}});
}

JsonRpcResponse handle_completion(const JsonRpcRequest& req, ServerContext& /*ctx*/) {
  std::string argument_name;
  auto argument_it = req.params.find("argument");
  if (argument_it != req.params.end() && argument_it->is_object()) {
    auto name_it = argument_it->find("name");
    if (name_it != argument_it->end() && name_it->is_string()) {
      argument_name = name_it->get<std::string>();
    }
  }

  json values = completion_suggestions(argument_name);
  const auto total = values.size();
  return make_response(req.id, json{{"completion",
                                     {
                                         {"values", std::move(values)},
                                         {"total", total},
                                         {"hasMore", false},
                                     }}});
}

JsonRpcResponse dispatch(const JsonRpcRequest& req, ServerContext& ctx) {
  const auto method = parse_method(req.method);
  if (!method.has_value()) {
    if (ctx.config.log_requests) {
      std::cerr << "Received unknown method: " << req.method << "\n";
    }
    return make_error_response(req.id, kMethodNotFound, "Method not found: " + req.method);
  }
  if (ctx.config.log_requests) {
    std::cerr << "Received: " << to_string(method.value()) << "\n";
  }

  switch (method.value()) {
    case Method::kInitialize:
      return handle_initialize(req, ctx);
    case Method::kToolsList:
      return handle_tools_list(req, ctx);
    case Method::kToolsCall:
      return handle_tools_call(req, ctx);
    case Method::kResourcesList:
      return handle_resources_list(req, ctx);
    case Method::kResourcesRead:
      return handle_resources_read(req, ctx);
    case Method::kCompletionComplete:
      return handle_completion(req, ctx);
  }
  return make_error_response(req.id, kMethodNotFound, "Method not found: " + req.method);
}

}  // namespace irmcp::mcp
