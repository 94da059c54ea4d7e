#include "irmcp/capability/capability_registry.h"

#include <algorithm>
#include <stdexcept>

namespace irmcp::capability {

namespace {

template <typename Entry>
void validate_entries(const std::vector<Entry>& entries, const std::string& kind) {
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto& [key, instance] = entries[i];
    if (key.empty()) {
      throw std::invalid_argument("Empty " + kind + " key at position " + std::to_string(i));
    }
    if (!instance) {
      throw std::invalid_argument("Null " + kind + " registered under '" + key + "'");
    }
    for (std::size_t j = 0; j < i; ++j) {
      if (entries[j].first == key) {
        throw std::invalid_argument("Duplicate " + kind + " key '" + key + "'");
      }
    }
  }
}

template <typename Entry>
auto find_entry(const std::vector<Entry>& entries, std::string_view key) {
  return std::find_if(entries.begin(), entries.end(),
                      [key](const Entry& entry) { return entry.first == key; });
}

}  // namespace

CapabilityRegistry::CapabilityRegistry(std::vector<ToolEntry> tools,
                                       std::vector<ResourceEntry> resources)
    : tools_(std::move(tools)), resources_(std::move(resources)) {
  validate_entries(tools_, "tool");
  validate_entries(resources_, "resource");
}

const ITool* CapabilityRegistry::lookup_tool(std::string_view key) const {
  auto it = find_entry(tools_, key);
  return it == tools_.end() ? nullptr : it->second.get();
}

const IResource* CapabilityRegistry::lookup_resource(std::string_view key) const {
  auto it = find_entry(resources_, key);
  return it == resources_.end() ? nullptr : it->second.get();
}

const ITool* CapabilityRegistry::resolve_tool(std::string_view external_name) const {
  if (!external_name.starts_with(kToolNamePrefix)) {
    return nullptr;
  }
  return lookup_tool(external_name.substr(kToolNamePrefix.size()));
}

const IResource* CapabilityRegistry::resolve_resource(std::string_view uri) const {
  const std::string prefix = resource_uri("");
  if (!uri.starts_with(prefix)) {
    return nullptr;
  }
  return lookup_resource(uri.substr(prefix.size()));
}

std::vector<ToolDescriptor> CapabilityRegistry::list_tools() const {
  std::vector<ToolDescriptor> descriptors;
  descriptors.reserve(tools_.size());
  for (const auto& [key, tool] : tools_) {
    descriptors.push_back({tool_external_name(key), tool->description(), tool->input_schema()});
  }
  return descriptors;
}

std::vector<ResourceDescriptor> CapabilityRegistry::list_resources() const {
  std::vector<ResourceDescriptor> descriptors;
  descriptors.reserve(resources_.size());
  for (const auto& [key, resource] : resources_) {
    descriptors.push_back(
        {resource_uri(key), resource->name(), resource->description(), resource->mime_type()});
  }
  return descriptors;
}

std::string tool_external_name(std::string_view key) {
  std::string name{kToolNamePrefix};
  name.append(key);
  return name;
}

std::string resource_uri(std::string_view key) {
  std::string uri{kResourceScheme};
  uri.append("://");
  uri.append(key);
  return uri;
}

}  // namespace irmcp::capability
