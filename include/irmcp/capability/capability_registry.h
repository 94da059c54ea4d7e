#pragma once

#include "irmcp/capability/resource.h"
#include "irmcp/capability/tool.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace irmcp::capability {

// Every tool is listed as kToolNamePrefix + key; tools/call must use the prefixed form.
constexpr std::string_view kToolNamePrefix = "inertia_rails_";

// Resources are addressed as kResourceScheme + "://" + key.
constexpr std::string_view kResourceScheme = "inertia-rails";

struct ToolDescriptor {
  std::string name;            // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  nlohmann::json input_schema;  // NOLINT(readability-identifier-naming)
};

struct ResourceDescriptor {
  std::string uri;          // NOLINT(readability-identifier-naming)
  std::string name;         // NOLINT(readability-identifier-naming)
  std::string description;  // NOLINT(readability-identifier-naming)
  std::string mime_type;    // NOLINT(readability-identifier-naming)
};

using ToolEntry = std::pair<std::string, std::unique_ptr<ITool>>;
using ResourceEntry = std::pair<std::string, std::unique_ptr<IResource>>;

// CapabilityRegistry owns every tool and resource for the process lifetime.
//
// Entries are fixed at construction and enumerated in registration order, so
// tools/list and resources/list are stable for the life of the process.
// Lookups return nullptr for unknown keys; there is no fallback capability.
class CapabilityRegistry {
 public:
  // Throws std::invalid_argument on an empty key, a null instance or a duplicate key.
  CapabilityRegistry(std::vector<ToolEntry> tools, std::vector<ResourceEntry> resources);

  CapabilityRegistry(const CapabilityRegistry&) = delete;
  CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;
  CapabilityRegistry(CapabilityRegistry&&) = default;
  CapabilityRegistry& operator=(CapabilityRegistry&&) = delete;

  [[nodiscard]] const ITool* lookup_tool(std::string_view key) const;
  [[nodiscard]] const IResource* lookup_resource(std::string_view key) const;

  // resolve_tool maps an externally visible name ("inertia_rails_<key>") to its tool.
  // Names without the prefix resolve to nullptr.
  [[nodiscard]] const ITool* resolve_tool(std::string_view external_name) const;

  // resolve_resource maps "inertia-rails://<key>" to its resource.
  // Any other scheme resolves to nullptr.
  [[nodiscard]] const IResource* resolve_resource(std::string_view uri) const;

  [[nodiscard]] std::vector<ToolDescriptor> list_tools() const;
  [[nodiscard]] std::vector<ResourceDescriptor> list_resources() const;

  [[nodiscard]] std::size_t tool_count() const { return tools_.size(); }
  [[nodiscard]] std::size_t resource_count() const { return resources_.size(); }

 private:
  std::vector<ToolEntry> tools_;
  std::vector<ResourceEntry> resources_;
};

[[nodiscard]] std::string tool_external_name(std::string_view key);
[[nodiscard]] std::string resource_uri(std::string_view key);

}  // namespace irmcp::capability
