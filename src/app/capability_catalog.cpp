#include "irmcp/app/capability_catalog.h"

#include "irmcp/resources/reference_resources.h"
#include "irmcp/tools/changelog_tool.h"
#include "irmcp/tools/documentation_tool.h"
#include "irmcp/tools/example_tool.h"
#include "irmcp/tools/method_lookup_tool.h"

#include <memory>
#include <vector>

namespace irmcp::app {

capability::CapabilityRegistry build_capability_registry(const corpus::CorpusPaths& paths) {
  std::vector<capability::ToolEntry> tool_entries;
  tool_entries.emplace_back("documentation",
                            std::make_unique<tools::DocumentationTool>(paths.docs_root));
  tool_entries.emplace_back("method_lookup", std::make_unique<tools::MethodLookupTool>());
  tool_entries.emplace_back("changelog", std::make_unique<tools::ChangelogTool>(paths.changelog));
  tool_entries.emplace_back("example", std::make_unique<tools::ExampleTool>());

  std::vector<capability::ResourceEntry> resource_entries;
  resource_entries.emplace_back("api_reference",
                                std::make_unique<resources::ApiReferenceResource>());
  resource_entries.emplace_back("configuration",
                                std::make_unique<resources::ConfigurationReferenceResource>());

  return capability::CapabilityRegistry(std::move(tool_entries), std::move(resource_entries));
}

}  // namespace irmcp::app
