#pragma once

#include "irmcp/capability/tool.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace irmcp::tools {

// Typed accessors over a tools/call "arguments" object.
// A present-but-mistyped value is always an InvalidArgumentsError; JSON null counts as absent.

inline std::optional<std::string> optional_string(const nlohmann::json& args,
                                                  const std::string& key) {
  auto it = args.find(key);
  if (it == args.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw capability::InvalidArgumentsError("'" + key + "' must be a string");
  }
  return it->get<std::string>();
}

inline std::string require_string(const nlohmann::json& args, const std::string& key) {
  auto value = optional_string(args, key);
  if (!value.has_value()) {
    throw capability::InvalidArgumentsError("'" + key + "' is required");
  }
  return std::move(value).value();
}

inline bool optional_bool(const nlohmann::json& args, const std::string& key,
                          const bool default_value) {
  auto it = args.find(key);
  if (it == args.end() || it->is_null()) {
    return default_value;
  }
  if (!it->is_boolean()) {
    throw capability::InvalidArgumentsError("'" + key + "' must be a boolean");
  }
  return it->get<bool>();
}

}  // namespace irmcp::tools
