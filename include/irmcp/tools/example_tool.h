#pragma once

#include "irmcp/capability/tool.h"

#include <optional>
#include <string>
#include <vector>

namespace irmcp::tools {

struct CodeExample {
  std::string topic;        // NOLINT(readability-identifier-naming)
  std::string description;  // NOLINT(readability-identifier-naming)
  std::string code;         // NOLINT(readability-identifier-naming)
};

/// Every topic the example tool serves, in schema enum order.
[[nodiscard]] const std::vector<CodeExample>& example_catalog();

[[nodiscard]] std::optional<CodeExample> find_example(const std::string& topic);

/// "lazy_loading" -> "Lazy loading"
[[nodiscard]] std::string humanize_topic(const std::string& topic);

class ExampleTool : public capability::ITool {
 public:
  [[nodiscard]] std::string description() const override;
  [[nodiscard]] nlohmann::json input_schema() const override;
  [[nodiscard]] std::string call(const nlohmann::json& arguments) const override;
};

}  // namespace irmcp::tools
