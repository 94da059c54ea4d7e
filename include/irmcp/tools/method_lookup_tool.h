#pragma once

#include "irmcp/capability/tool.h"

#include <string>
#include <vector>

namespace irmcp::tools {

/// Reference entry for one public Inertia-rails helper.
struct MethodInfo {
  std::string name;         // NOLINT(readability-identifier-naming)
  std::string signature;    // NOLINT(readability-identifier-naming)
  std::string description;  // NOLINT(readability-identifier-naming)
  std::string module;       // NOLINT(readability-identifier-naming)
  std::string example;      // NOLINT(readability-identifier-naming)
};

/// The fixed helper table, in presentation order.
[[nodiscard]] const std::vector<MethodInfo>& method_catalog();

/// Exact name match first; otherwise every entry whose name contains the lowercased query.
[[nodiscard]] std::vector<MethodInfo> find_methods(const std::string& method_name);

class MethodLookupTool : public capability::ITool {
 public:
  [[nodiscard]] std::string description() const override;
  [[nodiscard]] nlohmann::json input_schema() const override;
  [[nodiscard]] std::string call(const nlohmann::json& arguments) const override;
};

}  // namespace irmcp::tools
