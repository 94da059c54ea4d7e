#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace irmcp::capability {

/// Raised by ITool::call when the supplied arguments do not satisfy the tool's input schema.
/// The dispatcher reports it to the client as an invalid-params error.
class InvalidArgumentsError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

/// Invocable capability exposed through tools/list and tools/call.
///
/// Implementations are stateless: call() must not depend on side effects of a prior call.
class ITool {
 public:
  virtual ~ITool() = default;

  /// Human-readable summary shown in tools/list
  [[nodiscard]] virtual std::string description() const = 0;

  /// JSON Schema object describing the accepted arguments
  [[nodiscard]] virtual nlohmann::json input_schema() const = 0;

  /// Run the tool. arguments is always a JSON object (empty when the client sent none).
  /// Throws InvalidArgumentsError for schema violations.
  [[nodiscard]] virtual std::string call(const nlohmann::json& arguments) const = 0;
};

}  // namespace irmcp::capability
